#pragma once
#include <cstdint>
#include <string>
#include "../common/config.hpp"

// Weak hash is a polynomial hash over the bytes of a window,
//   h = sum(data[i] * BASE^(len-1-i)) mod MOD
// so the window can slide one byte at a time in constant work.
// Strong hash is an OpenSSL digest truncated to the signature's strong length.
class HashUtils {
public:
    static constexpr uint64_t BASE = 257;
    static constexpr uint64_t MOD = 1000000007;

    static uint32_t computeWeakHash(const char* data, size_t len) {
        uint64_t hash = 0;
        for (size_t i = 0; i < len; ++i) {
            hash = (hash * BASE + static_cast<unsigned char>(data[i])) % MOD;
        }
        return static_cast<uint32_t>(hash);
    }

    // BASE^exponent mod MOD
    static uint64_t basePower(size_t exponent) {
        uint64_t result = 1;
        uint64_t factor = BASE;
        while (exponent > 0) {
            if (exponent & 1) result = (result * factor) % MOD;
            factor = (factor * factor) % MOD;
            exponent >>= 1;
        }
        return result;
    }

    // slide a window of length n one byte forward, basePow = BASE^(n-1)
    static uint32_t rollWeakHash(uint32_t hash, char outByte, char inByte, uint64_t basePow) {
        uint64_t h = dropLeadingByte(hash, outByte, basePow);
        h = (h * BASE + static_cast<unsigned char>(inByte)) % MOD;
        return static_cast<uint32_t>(h);
    }

    // shrink a window of length n by its first byte, basePow = BASE^(n-1)
    static uint32_t dropLeadingByte(uint32_t hash, char outByte, uint64_t basePow) {
        uint64_t out = (static_cast<uint64_t>(static_cast<unsigned char>(outByte)) * basePow) % MOD;
        return static_cast<uint32_t>((MOD + hash - out) % MOD);
    }

    // largest strong length a format can carry, 0 for an unknown format
    static size_t maxStrongLength(SignatureFormat format);

    // raw digest bytes cut to strongLength, empty on failure
    static std::string computeStrongHash(SignatureFormat format, const char* data, size_t len, size_t strongLength);
};
