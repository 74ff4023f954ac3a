#include "buffer_window.hpp"
#include "data_io.hpp"
#include <algorithm>
#include <cstring>
#include <stdexcept>

BufferWindow::BufferWindow(size_t capacity) : buffer_(capacity) {}

void BufferWindow::consume(size_t n) {
    if (n > availableInput()) {
        throw std::out_of_range("BufferWindow::consume past the write cursor");
    }
    read_ += n;
}

void BufferWindow::commit(size_t n) {
    if (n > availableOutputCapacity()) {
        throw std::out_of_range("BufferWindow::commit past the capacity");
    }
    write_ += n;
}

size_t BufferWindow::append(const char* data, size_t length) {
    size_t count = std::min(length, availableOutputCapacity());
    if (count > 0) {
        std::memcpy(buffer_.data() + write_, data, count);
        write_ += count;
    }
    return count;
}

Result<size_t> BufferWindow::fill(DataSource& source) {
    size_t space = availableOutputCapacity();
    if (space == 0) {
        return Result<size_t>::Ok(0);
    }
    Result<size_t> got = source.read(buffer_.data() + write_, space);
    if (!got.success) {
        return got;
    }
    if (got.data > space) {
        return Result<size_t>::Error(ErrorKind::SourceReadError,
            "Source " + source.describe() + " returned more bytes than requested");
    }
    write_ += got.data;
    return got;
}

bool BufferWindow::compactIfNeeded() {
    if (read_ == 0) return false;
    if (read_ == write_) {
        // nothing unread, just rewind
        read_ = write_ = 0;
        return false;
    }
    size_t unread = write_ - read_;
    std::memmove(buffer_.data(), buffer_.data() + read_, unread);
    read_ = 0;
    write_ = unread;
    return true;
}

ByteSlice BufferWindow::takeOutput() {
    ByteSlice slice{buffer_.data() + read_, write_ - read_};
    read_ = write_;
    return slice;
}

void BufferWindow::reset() {
    read_ = 0;
    write_ = 0;
}
