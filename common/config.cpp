#include "config.hpp"

const char* signatureFormatName(SignatureFormat format) {
    switch (format) {
        case SignatureFormat::Sha1: return "sha1";
        case SignatureFormat::Blake2: return "blake2";
    }
    return "unknown";
}

bool parseSignatureFormat(const std::string& name, SignatureFormat& format) {
    if (name == "sha1") {
        format = SignatureFormat::Sha1;
        return true;
    }
    if (name == "blake2") {
        format = SignatureFormat::Blake2;
        return true;
    }
    return false;
}

Result<void> SyncConfig::validate() const {
    if (bufferSize < Config::MIN_BUFFER_SIZE) {
        return Result<void>::Error(ErrorKind::InsufficientBuffer,
            "Buffer size " + std::to_string(bufferSize) + " is below the minimum of " +
            std::to_string(Config::MIN_BUFFER_SIZE));
    }
    if (blockLength > Config::MAX_BLOCK_LENGTH) {
        return Result<void>::Error(ErrorKind::InvalidState,
            "Block length " + std::to_string(blockLength) + " exceeds " + std::to_string(Config::MAX_BLOCK_LENGTH));
    }
    return Result<void>::Ok();
}
