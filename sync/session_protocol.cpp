#include "session_protocol.hpp"

namespace SessionProtocol {

    Result<void> sendText(int socketFD, const std::string& text) {
        return ChunkFraming::writeChunk(socketFD, text.data(), text.size());
    }

    Result<std::string> receiveText(int socketFD) {
        Result<Bytes> frame = ChunkFraming::readChunk(socketFD);
        if (!frame.success) return Result<std::string>::Error(frame);
        return Result<std::string>::Ok(std::string(frame.data.begin(), frame.data.end()));
    }

    Result<void> sendStream(int socketFD, ByteStream& stream) {
        Result<void> streamed = ChunkFraming::sendStream(socketFD, stream, false);
        if (!streamed.success &&
            (streamed.kind == ErrorKind::ConnectionFailed || streamed.kind == ErrorKind::ConnectionClosed)) {
            return streamed;
        }

        Result<void> ended = ChunkFraming::writeChunk(socketFD, nullptr, 0);
        if (!ended.success) return ended;

        StatusMessage outcome = streamed.success
            ? StatusMessage(true, "Stream complete")
            : StatusMessage(false, std::string(errorKindName(streamed.kind)) + ": " + streamed.message);
        Result<void> reported = sendStatus(socketFD, outcome);
        if (!reported.success) return reported;
        return streamed;
    }

    Result<void> finishStream(int socketFD, FramedSocketStream& incoming) {
        while (true) {
            auto chunk = incoming.next();
            if (!chunk.success) return Result<void>::Error(chunk);
            if (!chunk.data) break;
        }

        Result<StatusMessage> status = receiveStatus(socketFD);
        if (!status.success) return Result<void>::Error(status);
        if (!status.data.status) {
            return Result<void>::Error(ErrorKind::ConnectionFailed, "Peer failed the stream: " + status.data.msg);
        }
        return Result<void>::Ok();
    }
}
