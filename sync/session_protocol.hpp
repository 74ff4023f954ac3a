#pragma once
#include <string>
#include "chunk_framing.hpp"

// Conversation used by push and pull. Every message is one frame:
//
//   client: "PUSH" | "PULL"           server: status
//   client: remote path               server: status (remote file exists)
//   then a sequence of streams, each one ended by a zero size frame and
//   followed by a status frame from its sender telling whether the stream
//   is complete.
namespace SessionProtocol {
    inline constexpr const char* PUSH = "PUSH";
    inline constexpr const char* PULL = "PULL";

    Result<void> sendText(int socketFD, const std::string& text);
    Result<std::string> receiveText(int socketFD);

    // frames the stream, ends it and reports its outcome to the peer;
    // the returned failure is the stream's own or the socket's
    Result<void> sendStream(int socketFD, ByteStream& stream);

    // skips whatever is left of the incoming stream and reads the sender's
    // status, a negative status becomes an error carrying the peer's message
    Result<void> finishStream(int socketFD, FramedSocketStream& incoming);
}
