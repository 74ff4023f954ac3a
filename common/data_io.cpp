#include "data_io.hpp"
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <filesystem>

namespace fs = std::filesystem;

namespace {
    std::string lastOsError() {
        return errno != 0 ? std::string(std::strerror(errno)) : std::string("unknown error");
    }
}

// ---------- FileSource ----------

FileSource::FileSource(const std::string& path) : path_(path) {}

Result<void> FileSource::open() {
    std::error_code ec;
    if (!fs::exists(path_, ec)) {
        return Result<void>::Error(ErrorKind::SourceNotFound, "File not found: " + path_);
    }
    errno = 0;
    file_.open(path_, std::ios::binary);
    if (!file_.is_open()) {
        return Result<void>::Error(ErrorKind::SourceOpenFailed, "Failed to open file: " + path_ + " (" + lastOsError() + ")");
    }
    return Result<void>::Ok();
}

Result<size_t> FileSource::read(char* buffer, size_t length) {
    if (!file_.is_open()) {
        return Result<size_t>::Error(ErrorKind::InvalidState, "Read from a file source that is not open: " + path_);
    }
    if (length == 0 || file_.eof()) {
        return Result<size_t>::Ok(0);
    }
    file_.read(buffer, static_cast<std::streamsize>(length));
    size_t bytesRead = static_cast<size_t>(file_.gcount());
    if (file_.bad()) {
        return Result<size_t>::Error(ErrorKind::SourceReadError, "Failed to read from file: " + path_);
    }
    return Result<size_t>::Ok(bytesRead);
}

Result<std::optional<uint64_t>> FileSource::size() const {
    std::error_code ec;
    uintmax_t fileSize = fs::file_size(path_, ec);
    if (ec) {
        return Result<std::optional<uint64_t>>::Error(ErrorKind::SourceReadError,
            "Cannot determine size of " + path_ + ": " + ec.message());
    }
    return Result<std::optional<uint64_t>>::Ok(static_cast<uint64_t>(fileSize));
}

void FileSource::close() {
    if (file_.is_open()) file_.close();
}

std::string FileSource::describe() const {
    return path_;
}

// ---------- MemorySource ----------

MemorySource::MemorySource(Bytes data) : data_(std::move(data)) {}

Result<void> MemorySource::open() {
    offset_ = 0;
    return Result<void>::Ok();
}

Result<size_t> MemorySource::read(char* buffer, size_t length) {
    size_t count = std::min(length, data_.size() - offset_);
    if (count > 0) {
        std::memcpy(buffer, data_.data() + offset_, count);
        offset_ += count;
    }
    return Result<size_t>::Ok(count);
}

Result<std::optional<uint64_t>> MemorySource::size() const {
    return Result<std::optional<uint64_t>>::Ok(static_cast<uint64_t>(data_.size()));
}

void MemorySource::close() {}

std::string MemorySource::describe() const {
    return "memory buffer of " + std::to_string(data_.size()) + " bytes";
}

// ---------- StreamSource ----------

StreamSource::StreamSource(ByteStream& stream) : stream_(&stream) {}

StreamSource::StreamSource(std::unique_ptr<ByteStream> stream)
    : owned_(std::move(stream)), stream_(owned_.get()) {}

Result<void> StreamSource::open() {
    if (stream_ == nullptr) {
        return Result<void>::Error(ErrorKind::InvalidState, "Stream source has no stream");
    }
    return Result<void>::Ok();
}

Result<size_t> StreamSource::read(char* buffer, size_t length) {
    size_t copied = 0;
    while (copied < length) {
        if (offset_ == current_.size()) {
            // only pull the next chunk when nothing has been copied yet,
            // a live stream may block on it
            if (ended_ || copied > 0) break;
            auto chunk = stream_->next();
            if (!chunk.success) {
                return Result<size_t>::Error(chunk);
            }
            if (!chunk.data) {
                ended_ = true;
                break;
            }
            current_ = std::move(*chunk.data);
            offset_ = 0;
            continue;
        }
        size_t count = std::min(length - copied, current_.size() - offset_);
        std::memcpy(buffer + copied, current_.data() + offset_, count);
        offset_ += count;
        copied += count;
    }
    return Result<size_t>::Ok(copied);
}

Result<std::optional<uint64_t>> StreamSource::size() const {
    return Result<std::optional<uint64_t>>::Ok(std::nullopt);
}

void StreamSource::close() {
    current_.clear();
    offset_ = 0;
    owned_.reset();
    stream_ = nullptr;
}

std::string StreamSource::describe() const {
    return "chunk stream";
}

// ---------- FileSink ----------

FileSink::FileSink(const std::string& path) : path_(path) {}

Result<void> FileSink::open() {
    errno = 0;
    file_.open(path_, std::ios::binary | std::ios::trunc);
    if (!file_.is_open()) {
        return Result<void>::Error(ErrorKind::SinkWriteError, "Failed to open output file: " + path_ + " (" + lastOsError() + ")");
    }
    return Result<void>::Ok();
}

Result<void> FileSink::write(const char* data, size_t length) {
    if (!file_.is_open()) {
        return Result<void>::Error(ErrorKind::InvalidState, "Write to an output file that is not open: " + path_);
    }
    file_.write(data, static_cast<std::streamsize>(length));
    if (!file_) {
        return Result<void>::Error(ErrorKind::SinkWriteError, "Failed to write to file: " + path_);
    }
    return Result<void>::Ok();
}

Result<void> FileSink::close() {
    if (!file_.is_open()) return Result<void>::Ok();
    file_.flush();
    bool flushed = static_cast<bool>(file_);
    file_.close();
    if (!flushed || file_.fail()) {
        return Result<void>::Error(ErrorKind::SinkWriteError, "Failed to flush file: " + path_);
    }
    return Result<void>::Ok();
}

// ---------- MemorySink ----------

Result<void> MemorySink::write(const char* data, size_t length) {
    data_.insert(data_.end(), data, data + length);
    return Result<void>::Ok();
}

Result<void> MemorySink::close() {
    return Result<void>::Ok();
}

// ---------- FileBasis ----------

FileBasis::FileBasis(const std::string& path) : path_(path) {}

Result<void> FileBasis::open() {
    std::error_code ec;
    if (!fs::exists(path_, ec)) {
        return Result<void>::Error(ErrorKind::SourceNotFound, "File not found: " + path_);
    }
    errno = 0;
    file_.open(path_, std::ios::binary);
    if (!file_.is_open()) {
        return Result<void>::Error(ErrorKind::SourceOpenFailed, "Failed to open file: " + path_ + " (" + lastOsError() + ")");
    }
    return Result<void>::Ok();
}

Result<size_t> FileBasis::readAt(uint64_t offset, size_t length, char* buffer) {
    if (!file_.is_open()) {
        return Result<size_t>::Error(ErrorKind::InvalidState, "Basis file is not open: " + path_);
    }
    file_.clear();  // a previous short read leaves eof set
    file_.seekg(static_cast<std::streamoff>(offset), std::ios::beg);
    if (!file_) {
        return Result<size_t>::Error(ErrorKind::SourceReadError, "Failed to seek to " + std::to_string(offset) + " in " + path_);
    }
    file_.read(buffer, static_cast<std::streamsize>(length));
    if (file_.bad()) {
        return Result<size_t>::Error(ErrorKind::SourceReadError, "Failed to read basis file: " + path_);
    }
    return Result<size_t>::Ok(static_cast<size_t>(file_.gcount()));
}

void FileBasis::close() {
    if (file_.is_open()) file_.close();
}
