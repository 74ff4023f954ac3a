#pragma once
#include <cstddef>
#include <optional>
#include <vector>
#include "result.hpp"

using Bytes = std::vector<char>;

// non-owning view into a buffer, only valid until the owner is touched again
struct ByteSlice {
    const char* data;
    size_t size;
};

// lazy pull sequence of non-empty chunks
// next() gives a chunk, std::nullopt once the sequence has ended, or an error
class ByteStream {
public:
    virtual ~ByteStream() = default;
    virtual Result<std::optional<Bytes>> next() = 0;
};

// hands out a fixed buffer in pieces of at most chunkSize bytes
class MemoryChunkStream : public ByteStream {
public:
    MemoryChunkStream(Bytes data, size_t chunkSize);
    Result<std::optional<Bytes>> next() override;

private:
    Bytes data_;
    size_t chunkSize_;
    size_t offset_ = 0;
};

// drain a stream into one buffer, only for streams known to fit in memory
Result<Bytes> collectStream(ByteStream& stream);
