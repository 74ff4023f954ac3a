#include "client_session.hpp"
#include "session_protocol.hpp"
#include "../common/log.hpp"

ClientSession::ClientSession(const std::string& ip, int port, int id, const SyncConfig& config)
    : sync_(config), ip_(ip), port_(port), sessionId_(id) {}

ClientSession::~ClientSession() {
    close();
}

Result<void> ClientSession::connectToServer() {
    Result<Socket> connected = connectTo(ip_, port_);
    if (!connected.success) {
        Log::error("Session " + std::to_string(sessionId_), connected.message);
        return Result<void>::Error(connected);
    }
    socket_ = std::move(connected.data);
    Log::info("Session " + std::to_string(sessionId_), "Connected to " + ip_ + ":" + std::to_string(port_));
    return Result<void>::Ok();
}

void ClientSession::close() {
    if (socket_.valid()) {
        socket_.close();
        Log::debug("Session " + std::to_string(sessionId_), "Connection closed.");
    }
}

bool ClientSession::isConnected() const {
    return socket_.valid();
}

Result<void> ClientSession::push(const std::string& localPath, const std::string& remotePath) {
    if (!isConnected()) return Result<void>::Error(ErrorKind::InvalidState, "Session is not connected");
    Result<void> result = pushTransaction(localPath, remotePath);
    // one transaction per connection
    close();
    return result;
}

Result<void> ClientSession::pull(const std::string& remotePath, const std::string& localPath) {
    if (!isConnected()) return Result<void>::Error(ErrorKind::InvalidState, "Session is not connected");
    Result<void> result = pullTransaction(remotePath, localPath);
    close();
    return result;
}

void ClientSession::printClientMessage(const std::string& message) const {
    Log::info("Session " + std::to_string(sessionId_) + ": Client", message);
}

// positive status from the server, the message is logged either way
Result<void> ClientSession::receivingStatus() {
    const std::string tag = "Session " + std::to_string(sessionId_) + ": Server";
    Result<StatusMessage> message = receiveStatus(socket_.fd());
    if (!message.success) {
        Log::error(tag, "Error while receiving status: " + message.message);
        return Result<void>::Error(message);
    }
    if (!message.data.status) {
        Log::error(tag, message.data.msg);
        return Result<void>::Error(ErrorKind::ConnectionFailed, message.data.msg);
    }
    Log::info(tag, message.data.msg);
    return Result<void>::Ok();
}

Result<void> ClientSession::startRequest(const char* command, const std::string& remotePath) {
    Result<void> sent = SessionProtocol::sendText(socket_.fd(), command);
    if (!sent.success) return sent;
    Result<void> accepted = receivingStatus();
    if (!accepted.success) return accepted;

    sent = SessionProtocol::sendText(socket_.fd(), remotePath);
    if (!sent.success) return sent;
    printClientMessage(std::string(command) + " request sent for " + remotePath);
    return receivingStatus();
}

Result<void> ClientSession::pushTransaction(const std::string& localPath, const std::string& remotePath) {
    Result<void> started = startRequest(SessionProtocol::PUSH, remotePath);
    if (!started.success) return started;

    // signature of the remote copy
    FramedSocketStream incoming(socket_.fd());
    auto handle = sync_.loadSignature(incoming);
    Result<void> finished = SessionProtocol::finishStream(socket_.fd(), incoming);
    if (!finished.success) return finished;
    if (!handle.success) {
        printClientMessage("Failed to load the remote signature: " + handle.message);
        return Result<void>::Error(handle);
    }
    auto blocks = handle.data->withSignature([](const std::shared_ptr<Signature>& signature) {
        return Result<size_t>::Ok(signature->blockCount());
    });
    printClientMessage("Signature of " + std::to_string(blocks.data) + " blocks received");

    // delta of the local file against it
    printClientMessage("Generating the delta of " + localPath);
    DeltaStream delta = sync_.deltaStream(localPath, handle.data);
    Result<void> sent = SessionProtocol::sendStream(socket_.fd(), delta);
    if (!sent.success) {
        printClientMessage("Failed to send delta: " + sent.message);
        return sent;
    }

    Result<void> applied = receivingStatus();
    if (!applied.success) return applied;
    printClientMessage("Content Pushed to the remote file");
    return Result<void>::Ok();
}

Result<void> ClientSession::pullTransaction(const std::string& remotePath, const std::string& localPath) {
    Result<void> started = startRequest(SessionProtocol::PULL, remotePath);
    if (!started.success) return started;

    // signature of the local copy
    printClientMessage("Generating the signature of " + localPath);
    SignatureStream signature = sync_.signatureStream(localPath);
    Result<void> sent = SessionProtocol::sendStream(socket_.fd(), signature);
    if (!sent.success) {
        printClientMessage("Failed to send signature: " + sent.message);
        return sent;
    }
    Result<void> loaded = receivingStatus();
    if (!loaded.success) return loaded;

    // delta of the remote file
    FramedSocketStream incoming(socket_.fd());
    Result<Bytes> delta = collectStream(incoming);
    Result<void> finished = SessionProtocol::finishStream(socket_.fd(), incoming);
    if (!finished.success) return finished;
    if (!delta.success) return Result<void>::Error(delta);
    printClientMessage("Delta of " + std::to_string(delta.data.size()) + " bytes received");

    Result<void> patched = sync_.patch(localPath, delta.data);
    if (!patched.success) {
        printClientMessage("Error while applying delta: " + patched.message);
        return patched;
    }
    printClientMessage("Content pulled successfully");
    return Result<void>::Ok();
}
