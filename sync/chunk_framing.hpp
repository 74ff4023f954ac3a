#pragma once
#include <string>
#include "../common/byte_stream.hpp"
#include "../common/result.hpp"

// Chunked framing over a stream socket:
//
//   <size in lowercase hex>\r\n<size bytes>\r\n
//
// The format itself has no stream terminator. Sync sessions end each stream
// with a zero size frame; pipelines never write one.
namespace ChunkFraming {
    Result<void> writeChunk(int socketFD, const char* data, size_t length);
    Result<void> writeChunk(int socketFD, const Bytes& data);
    // ConnectionClosed when the peer closed before the first header byte
    Result<Bytes> readChunk(int socketFD, size_t maxFrameSize);
    Result<Bytes> readChunk(int socketFD);

    // frames every chunk of a stream, then the zero size frame when terminate is set
    Result<void> sendStream(int socketFD, ByteStream& stream, bool terminate = true);
}

// frames read from a socket as a ByteStream, ends on a zero size frame or on close
class FramedSocketStream : public ByteStream {
public:
    explicit FramedSocketStream(int socketFD, bool endOnEmptyFrame = true);
    Result<std::optional<Bytes>> next() override;

private:
    int socketFD_;
    bool endOnEmptyFrame_;
    bool ended_ = false;
};

struct StatusMessage {
    bool status;
    std::string msg;
    StatusMessage() : status(false) {}
    StatusMessage(bool stat, std::string mess) : status(stat), msg(std::move(mess)) {}
};

// one frame, first byte is the status, the rest the message
Result<void> sendStatus(int socketFD, const StatusMessage& statusMessage);
Result<StatusMessage> receiveStatus(int socketFD);
