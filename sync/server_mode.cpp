#include "server_mode.hpp"
#include "session_protocol.hpp"
#include "../common/log.hpp"
#include "../common/thread_pool.hpp"
#include <filesystem>

ServerMode::ServerMode(int port, const SyncConfig& config)
    : sync_(config), port_(port), activeClients_(0) {}

Result<void> ServerMode::startServer() {
    Result<void> ready = setupSocket();
    if (!ready.success) return ready;
    acceptConnections();
    return Result<void>::Ok();
}

Result<void> ServerMode::setupSocket() {
    Result<Socket> listening = listenOn(port_, Config::MAX_CONNECTIONS);
    if (!listening.success) {
        Log::error("Server", listening.message);
        return Result<void>::Error(listening);
    }
    serverSocket_ = std::move(listening.data);

    Result<int> bound = localPort(serverSocket_.fd());
    if (!bound.success) return Result<void>::Error(bound);
    port_ = bound.data;

    Log::info("Server", "Listening on port " + std::to_string(port_) + "...");
    return Result<void>::Ok();
}

void ServerMode::acceptConnections(size_t maxClients) {
    ThreadPool pool(Config::MAX_CONNECTIONS);
    size_t accepted = 0;

    while (maxClients == 0 || accepted < maxClients) {
        {
            std::unique_lock<std::mutex> lock(mtx_);
            cv_.wait(lock, [this]() {
                return activeClients_ < static_cast<int>(Config::MAX_CONNECTIONS);
            });
        }

        std::string clientIP;
        Result<Socket> client = acceptClient(serverSocket_.fd(), clientIP);
        if (!client.success) {
            Log::error("Server", client.message);
            break;
        }

        {
            std::lock_guard<std::mutex> guard(mtx_);
            activeClients_++;
        }
        accepted++;

        Log::info("Server", "Connection accepted from " + clientIP);

        // the pool task owns the descriptor from here on
        auto connection = std::make_shared<Socket>(std::move(client.data));
        pool.submit([this, connection]() {
            int clientSocket = connection->fd();
            this->handleClient(clientSocket);
            connection->close();
            {
                std::lock_guard<std::mutex> guard(mtx_);
                activeClients_--;
            }
            cv_.notify_one();
        });
    }
}

bool ServerMode::reply(int clientSocket, bool status, const std::string& message) {
    if (!status) Log::warn("Server", message);
    Result<void> sent = sendStatus(clientSocket, StatusMessage(status, message));
    if (!sent.success) {
        Log::error("Server", "Failed to send status: " + sent.message);
        return false;
    }
    return status;
}

void ServerMode::handleClient(int clientSocket) {
    Result<std::string> command = SessionProtocol::receiveText(clientSocket);
    if (!command.success) {
        Log::warn("Server", "Failed to read command: " + command.message);
        return;
    }

    const std::string& mode = command.data;
    if (mode == SessionProtocol::PUSH) {
        if (reply(clientSocket, true, "Starting the " + mode + " request"))
            pushTransaction(clientSocket);
    } else if (mode == SessionProtocol::PULL) {
        if (reply(clientSocket, true, "Starting the " + mode + " request"))
            pullTransaction(clientSocket);
    } else {
        reply(clientSocket, false, "Invalid mode: " + mode);
    }
}

bool ServerMode::receiveRemotePath(int clientSocket, std::string& remotePath) {
    Result<std::string> path = SessionProtocol::receiveText(clientSocket);
    if (!path.success) {
        return reply(clientSocket, false, "Error while receiving remote path: " + path.message);
    }
    remotePath = path.data;
    if (!std::filesystem::is_regular_file(remotePath)) {
        return reply(clientSocket, false, "Remote file not found: " + remotePath);
    }
    return true;
}

bool ServerMode::pushTransaction(int clientSocket) {
    std::string remotePath;
    if (!receiveRemotePath(clientSocket, remotePath)) return false;
    if (!reply(clientSocket, true, "Generating the signature for " + remotePath + "...")) return false;

    // 1. signature of the remote copy
    SignatureStream signature = sync_.signatureStream(remotePath);
    Result<void> sent = SessionProtocol::sendStream(clientSocket, signature);
    if (!sent.success) {
        Log::warn("Server", "Signature of " + remotePath + " not sent: " + sent.message);
        return false;
    }

    // 2. delta of the client's local file
    FramedSocketStream incoming(clientSocket);
    Result<Bytes> delta = collectStream(incoming);
    Result<void> finished = SessionProtocol::finishStream(clientSocket, incoming);
    if (!finished.success) {
        Log::warn("Server", "Delta not received: " + finished.message);
        return false;
    }
    if (!delta.success) {
        return reply(clientSocket, false, "Error while receiving delta: " + delta.message);
    }

    // 3. apply it
    Result<void> patched = sync_.patch(remotePath, delta.data);
    if (!patched.success) {
        return reply(clientSocket, false, "Error while applying delta:: " + patched.message);
    }
    Log::info("Server", "Patched " + remotePath + " from " + std::to_string(delta.data.size()) + " delta bytes");
    return reply(clientSocket, true, "Push request performed successfully");
}

bool ServerMode::pullTransaction(int clientSocket) {
    std::string remotePath;
    if (!receiveRemotePath(clientSocket, remotePath)) return false;
    if (!reply(clientSocket, true, "Received the remote file path")) return false;

    // 1. signature of the client's local copy
    FramedSocketStream incoming(clientSocket);
    auto handle = sync_.loadSignature(incoming);
    Result<void> finished = SessionProtocol::finishStream(clientSocket, incoming);
    if (!finished.success) {
        Log::warn("Server", "Signature not received: " + finished.message);
        return false;
    }
    if (!handle.success) {
        return reply(clientSocket, false, "Error while loading signature: " + handle.message);
    }
    if (!reply(clientSocket, true, "Signature received, generating delta...")) return false;

    // 2. delta of the remote file against it
    DeltaStream delta = sync_.deltaStream(remotePath, handle.data);
    Result<void> sent = SessionProtocol::sendStream(clientSocket, delta);
    if (!sent.success) {
        Log::warn("Server", "Delta of " + remotePath + " not sent: " + sent.message);
        return false;
    }
    return true;
}
