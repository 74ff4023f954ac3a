#include "byte_stream.hpp"
#include <algorithm>

MemoryChunkStream::MemoryChunkStream(Bytes data, size_t chunkSize)
    : data_(std::move(data)), chunkSize_(chunkSize == 0 ? 1 : chunkSize) {}

Result<std::optional<Bytes>> MemoryChunkStream::next() {
    if (offset_ >= data_.size()) {
        return Result<std::optional<Bytes>>::Ok(std::nullopt);
    }
    size_t length = std::min(chunkSize_, data_.size() - offset_);
    Bytes chunk(data_.begin() + offset_, data_.begin() + offset_ + length);
    offset_ += length;
    return Result<std::optional<Bytes>>::Ok(std::move(chunk));
}

Result<Bytes> collectStream(ByteStream& stream) {
    Bytes collected;
    while (true) {
        auto chunk = stream.next();
        if (!chunk.success) {
            return Result<Bytes>::Error(chunk);
        }
        if (!chunk.data) break;
        collected.insert(collected.end(), chunk.data->begin(), chunk.data->end());
    }
    return Result<Bytes>::Ok(std::move(collected));
}
