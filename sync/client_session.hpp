#pragma once
#include <string>
#include "connection.hpp"
#include "delta_sync.hpp"

// One connection to a ServerMode, good for a single push or pull.
class ClientSession {
public:
    ClientSession(const std::string& ip, int port, int id, const SyncConfig& config = SyncConfig{});
    ~ClientSession();

    Result<void> connectToServer();
    void close();
    bool isConnected() const;

    // makes remotePath on the server identical to localPath
    Result<void> push(const std::string& localPath, const std::string& remotePath);
    // makes localPath identical to remotePath on the server
    Result<void> pull(const std::string& remotePath, const std::string& localPath);

private:
    Result<void> pushTransaction(const std::string& localPath, const std::string& remotePath);
    Result<void> pullTransaction(const std::string& remotePath, const std::string& localPath);
    Result<void> startRequest(const char* command, const std::string& remotePath);
    Result<void> receivingStatus();
    void printClientMessage(const std::string& message) const;

    DeltaSync sync_;
    std::string ip_;
    int port_;
    int sessionId_;
    Socket socket_;
};
