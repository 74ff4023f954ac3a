#include "hash_utils.hpp"
#include <openssl/evp.h>

size_t HashUtils::maxStrongLength(SignatureFormat format) {
    switch (format) {
        case SignatureFormat::Sha1: return 20;
        case SignatureFormat::Blake2: return 32;
    }
    return 0;
}

std::string HashUtils::computeStrongHash(SignatureFormat format, const char* data, size_t len, size_t strongLength) {
    const EVP_MD* md = nullptr;
    switch (format) {
        case SignatureFormat::Sha1: md = EVP_sha1(); break;
        case SignatureFormat::Blake2: md = EVP_blake2b512(); break;
    }
    if (md == nullptr || strongLength == 0 || strongLength > maxStrongLength(format)) return {};

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int digestLen = 0;
    if (EVP_Digest(data, len, digest, &digestLen, md, nullptr) != 1 || digestLen < strongLength) {
        return {};
    }
    return std::string(reinterpret_cast<const char*>(digest), strongLength);
}
