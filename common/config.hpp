// config.hpp
#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include "result.hpp"

namespace Config {
    inline constexpr size_t DEFAULT_BUFFER_SIZE = 64 * 1024;   // I/O granularity of one pipeline step
    inline constexpr size_t MIN_BUFFER_SIZE = 256;
    inline constexpr size_t DEFAULT_BLOCK_LENGTH = 2048;       // used when the source size is unknown
    inline constexpr size_t MIN_AUTO_BLOCK_LENGTH = 256;
    inline constexpr size_t MAX_AUTO_BLOCK_LENGTH = 16 * 1024;
    inline constexpr size_t MAX_BLOCK_LENGTH = 1024 * 1024;
    inline constexpr size_t MAX_LITERAL_RUN = 64 * 1024;       // longest INSERT command emitted
    inline constexpr size_t FRAME_HEADER_WINDOW = 16;          // hex size + CRLF must fit here
    inline constexpr size_t MAX_FRAME_SIZE = 64 * 1024 * 1024;
    inline constexpr int DEFAULT_PORT = 5612;
    inline constexpr int MAX_CONNECTIONS = 3;
}

// selects the strong hash family embedded in a signature, the value is the magic number
enum class SignatureFormat : uint32_t {
    Sha1 = 0x64730131,
    Blake2 = 0x64730132
};

const char* signatureFormatName(SignatureFormat format);
bool parseSignatureFormat(const std::string& name, SignatureFormat& format);

// immutable once handed to a pipeline, pipelines keep their own copy
struct SyncConfig {
    size_t bufferSize = Config::DEFAULT_BUFFER_SIZE;
    size_t blockLength = 0;     // 0 = engine picks from source size
    size_t strongLength = 0;    // 0 = engine picks from source size
    SignatureFormat signatureFormat = SignatureFormat::Blake2;

    Result<void> validate() const;
};
