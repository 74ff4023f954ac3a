#include "chunk_framing.hpp"
#include "../common/config.hpp"
#include "../common/log.hpp"
#include <sys/socket.h>
#include <cerrno>
#include <cstdio>
#include <cstring>

namespace {

    Result<void> sendAll(int socketFD, const char* data, size_t length) {
        while (length > 0) {
            ssize_t sent = send(socketFD, data, length, MSG_NOSIGNAL);
            if (sent < 0 && errno == EINTR) continue;
            if (sent <= 0) {
                return Result<void>::Error(ErrorKind::ConnectionFailed,
                    std::string("Send failed: ") + (sent < 0 ? std::strerror(errno) : "connection closed"));
            }
            data += sent;
            length -= static_cast<size_t>(sent);
        }
        return Result<void>::Ok();
    }

    Result<void> recvAll(int socketFD, char* data, size_t length) {
        while (length > 0) {
            ssize_t received = recv(socketFD, data, length, 0);
            if (received < 0 && errno == EINTR) continue;
            if (received <= 0) {
                return Result<void>::Error(ErrorKind::ConnectionFailed,
                    std::string("Receive failed: ") + (received < 0 ? std::strerror(errno) : "connection closed mid frame"));
            }
            data += received;
            length -= static_cast<size_t>(received);
        }
        return Result<void>::Ok();
    }

    ssize_t peek(int socketFD, char* buffer, size_t length, int flags) {
        ssize_t n;
        do {
            n = recv(socketFD, buffer, length, MSG_PEEK | flags);
        } while (n < 0 && errno == EINTR);
        return n;
    }

    bool parseHex(const char* text, size_t length, size_t& value) {
        if (length == 0) return false;
        value = 0;
        for (size_t i = 0; i < length; ++i) {
            char c = text[i];
            int digit;
            if (c >= '0' && c <= '9') digit = c - '0';
            else if (c >= 'a' && c <= 'f') digit = c - 'a' + 10;
            else if (c >= 'A' && c <= 'F') digit = c - 'A' + 10;
            else return false;
            value = value * 16 + static_cast<size_t>(digit);
        }
        return true;
    }

    // size of the frame at the head of the socket, the header is consumed only once it parsed
    Result<size_t> readHeader(int socketFD) {
        char header[Config::FRAME_HEADER_WINDOW];
        const size_t window = sizeof(header);

        ssize_t peeked = peek(socketFD, header, window, 0);
        while (true) {
            if (peeked == 0) {
                return Result<size_t>::Error(ErrorKind::ConnectionClosed, "Connection closed by peer");
            }
            if (peeked < 0) {
                return Result<size_t>::Error(ErrorKind::ConnectionFailed, std::string("Receive failed: ") + std::strerror(errno));
            }

            const size_t available = static_cast<size_t>(peeked);
            for (size_t i = 0; i + 1 < available; ++i) {
                if (header[i] == '\r' && header[i + 1] == '\n') {
                    size_t chunkSize = 0;
                    if (!parseHex(header, i, chunkSize)) {
                        return Result<size_t>::Error(ErrorKind::ConnectionFailed,
                            "Malformed chunk header: " + std::string(header, i));
                    }
                    char discard[Config::FRAME_HEADER_WINDOW];
                    Result<void> consumed = recvAll(socketFD, discard, i + 2);
                    if (!consumed.success) return Result<size_t>::Error(consumed);
                    return Result<size_t>::Ok(chunkSize);
                }
            }

            if (available >= window) {
                return Result<size_t>::Error(ErrorKind::ConnectionFailed, "Unterminated chunk header");
            }
            // header only partly arrived, wait until at least one more byte is there
            ssize_t more = peek(socketFD, header, available + 1, MSG_WAITALL);
            if (more >= 0 && static_cast<size_t>(more) <= available) {
                return Result<size_t>::Error(ErrorKind::ConnectionFailed, "Connection closed inside chunk header");
            }
            peeked = more;
        }
    }
}

namespace ChunkFraming {

    Result<void> writeChunk(int socketFD, const char* data, size_t length) {
        char header[Config::FRAME_HEADER_WINDOW];
        int headerLength = std::snprintf(header, sizeof(header), "%zx\r\n", length);
        if (headerLength <= 0 || static_cast<size_t>(headerLength) >= sizeof(header)) {
            return Result<void>::Error(ErrorKind::ConnectionFailed, "Chunk size does not fit a header");
        }

        Result<void> sent = sendAll(socketFD, header, static_cast<size_t>(headerLength));
        if (!sent.success) return sent;
        if (length > 0) {
            sent = sendAll(socketFD, data, length);
            if (!sent.success) return sent;
        }
        sent = sendAll(socketFD, "\r\n", 2);
        if (!sent.success) return sent;

        Log::debug("Connection", "Chunk " + std::to_string(length) + " sent");
        return Result<void>::Ok();
    }

    Result<void> writeChunk(int socketFD, const Bytes& data) {
        return writeChunk(socketFD, data.data(), data.size());
    }

    Result<Bytes> readChunk(int socketFD, size_t maxFrameSize) {
        Result<size_t> header = readHeader(socketFD);
        if (!header.success) return Result<Bytes>::Error(header);

        const size_t chunkSize = header.data;
        if (chunkSize > maxFrameSize) {
            return Result<Bytes>::Error(ErrorKind::ConnectionFailed,
                "Chunk of " + std::to_string(chunkSize) + " bytes exceeds the limit of " + std::to_string(maxFrameSize));
        }

        Bytes data(chunkSize);
        if (chunkSize > 0) {
            Result<void> body = recvAll(socketFD, data.data(), chunkSize);
            if (!body.success) return Result<Bytes>::Error(body);
        }

        char trailer[2];
        Result<void> tail = recvAll(socketFD, trailer, sizeof(trailer));
        if (!tail.success) return Result<Bytes>::Error(tail);
        if (trailer[0] != '\r' || trailer[1] != '\n') {
            return Result<Bytes>::Error(ErrorKind::ConnectionFailed, "Chunk not terminated by CRLF");
        }

        Log::debug("Connection", "Chunk of " + std::to_string(chunkSize) + " received");
        return Result<Bytes>::Ok(std::move(data));
    }

    Result<Bytes> readChunk(int socketFD) {
        return readChunk(socketFD, Config::MAX_FRAME_SIZE);
    }

    Result<void> sendStream(int socketFD, ByteStream& stream, bool terminate) {
        while (true) {
            auto chunk = stream.next();
            if (!chunk.success) return Result<void>::Error(chunk);
            if (!chunk.data) break;
            Result<void> sent = writeChunk(socketFD, *chunk.data);
            if (!sent.success) return sent;
        }
        if (terminate) return writeChunk(socketFD, nullptr, 0);
        return Result<void>::Ok();
    }
}

FramedSocketStream::FramedSocketStream(int socketFD, bool endOnEmptyFrame)
    : socketFD_(socketFD), endOnEmptyFrame_(endOnEmptyFrame) {}

Result<std::optional<Bytes>> FramedSocketStream::next() {
    using ChunkResult = Result<std::optional<Bytes>>;
    while (!ended_) {
        Result<Bytes> chunk = ChunkFraming::readChunk(socketFD_);
        if (!chunk.success) {
            if (chunk.kind == ErrorKind::ConnectionClosed) {
                ended_ = true;
                break;
            }
            return ChunkResult::Error(chunk);
        }
        if (chunk.data.empty()) {
            if (endOnEmptyFrame_) ended_ = true;
            continue;  // stream elements are never empty
        }
        return ChunkResult::Ok(std::move(chunk.data));
    }
    return ChunkResult::Ok(std::nullopt);
}

Result<void> sendStatus(int socketFD, const StatusMessage& statusMessage) {
    Bytes frame;
    frame.reserve(statusMessage.msg.size() + 1);
    frame.push_back(statusMessage.status ? 1 : 0);
    frame.insert(frame.end(), statusMessage.msg.begin(), statusMessage.msg.end());
    return ChunkFraming::writeChunk(socketFD, frame);
}

Result<StatusMessage> receiveStatus(int socketFD) {
    Result<Bytes> frame = ChunkFraming::readChunk(socketFD);
    if (!frame.success) return Result<StatusMessage>::Error(frame);
    if (frame.data.empty()) {
        return Result<StatusMessage>::Error(ErrorKind::ConnectionFailed, "Empty status frame");
    }
    return Result<StatusMessage>::Ok(StatusMessage(frame.data[0] != 0, std::string(frame.data.begin() + 1, frame.data.end())));
}
