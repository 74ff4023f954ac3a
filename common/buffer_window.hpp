#pragma once
#include <cstddef>
#include <vector>
#include "byte_stream.hpp"
#include "result.hpp"

class DataSource;

// Fixed capacity byte region with a read cursor and a write cursor.
//
//   0 <= readCursor <= writeCursor <= capacity
//
// [readCursor, writeCursor) is the unread data ("available input"),
// [writeCursor, capacity) is the free tail that fill/append/commit write into.
// Compaction slides the unread bytes to offset zero so the tail can grow again.
class BufferWindow {
public:
    explicit BufferWindow(size_t capacity);

    size_t capacity() const { return buffer_.size(); }
    size_t readCursor() const { return read_; }
    size_t writeCursor() const { return write_; }
    size_t availableInput() const { return write_ - read_; }
    size_t availableOutputCapacity() const { return buffer_.size() - write_; }
    bool full() const { return read_ == 0 && write_ == buffer_.size(); }

    const char* readPtr() const { return buffer_.data() + read_; }
    char* writePtr() { return buffer_.data() + write_; }

    // mark n unread bytes as used
    void consume(size_t n);
    // mark n bytes written at writePtr() as data
    void commit(size_t n);
    // copy as much of data as the tail can hold, returns the count copied
    size_t append(const char* data, size_t length);

    // read from source into the free tail, 0 bytes means the source is exhausted
    Result<size_t> fill(DataSource& source);
    // returns true when bytes were moved
    bool compactIfNeeded();
    // the unread region, valid until the window is written or reset
    ByteSlice takeOutput();
    void reset();

private:
    std::vector<char> buffer_;
    size_t read_ = 0;
    size_t write_ = 0;
};
