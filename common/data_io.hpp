#pragma once
#include <cstdint>
#include <fstream>
#include <memory>
#include <optional>
#include <string>
#include "byte_stream.hpp"
#include "result.hpp"

// sequential input of a pipeline
class DataSource {
public:
    virtual ~DataSource() = default;

    // checks existence and acquires the underlying resource
    virtual Result<void> open() = 0;
    // reads up to length bytes, 0 means the data is exhausted
    virtual Result<size_t> read(char* buffer, size_t length) = 0;
    // total size when it can be known up front, nullopt for live streams
    virtual Result<std::optional<uint64_t>> size() const = 0;
    virtual void close() = 0;
    virtual std::string describe() const = 0;
};

class FileSource : public DataSource {
public:
    explicit FileSource(const std::string& path);
    Result<void> open() override;
    Result<size_t> read(char* buffer, size_t length) override;
    Result<std::optional<uint64_t>> size() const override;
    void close() override;
    std::string describe() const override;

private:
    std::string path_;
    std::ifstream file_;
};

class MemorySource : public DataSource {
public:
    explicit MemorySource(Bytes data);
    Result<void> open() override;
    Result<size_t> read(char* buffer, size_t length) override;
    Result<std::optional<uint64_t>> size() const override;
    void close() override;
    std::string describe() const override;

private:
    Bytes data_;
    size_t offset_ = 0;
};

// pulls chunks from a ByteStream and serves them as a flat byte source
class StreamSource : public DataSource {
public:
    explicit StreamSource(ByteStream& stream);
    explicit StreamSource(std::unique_ptr<ByteStream> stream);
    Result<void> open() override;
    Result<size_t> read(char* buffer, size_t length) override;
    Result<std::optional<uint64_t>> size() const override;
    void close() override;
    std::string describe() const override;

private:
    std::unique_ptr<ByteStream> owned_;
    ByteStream* stream_;
    Bytes current_;
    size_t offset_ = 0;
    bool ended_ = false;
};

// sequential output of a pipeline
class DataSink {
public:
    virtual ~DataSink() = default;
    virtual Result<void> write(const char* data, size_t length) = 0;
    virtual Result<void> close() = 0;
};

class FileSink : public DataSink {
public:
    explicit FileSink(const std::string& path);
    Result<void> open();
    Result<void> write(const char* data, size_t length) override;
    Result<void> close() override;
    const std::string& path() const { return path_; }

private:
    std::string path_;
    std::ofstream file_;
};

class MemorySink : public DataSink {
public:
    Result<void> write(const char* data, size_t length) override;
    Result<void> close() override;
    const Bytes& data() const { return data_; }

private:
    Bytes data_;
};

// random access reads of the basis file during patching
class FileBasis {
public:
    explicit FileBasis(const std::string& path);
    Result<void> open();
    Result<size_t> readAt(uint64_t offset, size_t length, char* buffer);
    void close();
    const std::string& path() const { return path_; }

private:
    std::string path_;
    std::ifstream file_;
};
