#pragma once
#include <arpa/inet.h>
#include <endian.h>
#include <cstdint>
#include <cstring>
#include <vector>

enum class DeltaType : uint8_t { END = 0x00, COPY = 0x01, INSERT = 0x02 };

namespace WireFormat {
    inline constexpr uint32_t DELTA_MAGIC = 0x64730236;
    inline constexpr size_t MAGIC_SIZE = 4;
    inline constexpr size_t SIGNATURE_HEADER_SIZE = 12;  // magic, block length, strong length
    inline constexpr size_t COPY_COMMAND_SIZE = 13;      // type, u64 offset, u32 length
    inline constexpr size_t INSERT_HEADER_SIZE = 5;      // type, u32 length

    inline void putU32(std::vector<char>& out, uint32_t value) {
        uint32_t net = htonl(value);
        const char* p = reinterpret_cast<const char*>(&net);
        out.insert(out.end(), p, p + sizeof(net));
    }

    inline void putU64(std::vector<char>& out, uint64_t value) {
        uint64_t net = htobe64(value);
        const char* p = reinterpret_cast<const char*>(&net);
        out.insert(out.end(), p, p + sizeof(net));
    }

    inline uint32_t getU32(const char* data) {
        uint32_t net;
        std::memcpy(&net, data, sizeof(net));
        return ntohl(net);
    }

    inline uint64_t getU64(const char* data) {
        uint64_t net;
        std::memcpy(&net, data, sizeof(net));
        return be64toh(net);
    }
}
