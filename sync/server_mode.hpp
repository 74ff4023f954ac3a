// Serves push and pull requests: the server holds the remote copies, sends
// their signatures, patches them from received deltas and streams deltas back.

#pragma once
#include <atomic>
#include <condition_variable>
#include <mutex>
#include "connection.hpp"
#include "delta_sync.hpp"

class ServerMode {
public:
    explicit ServerMode(int port, const SyncConfig& config = SyncConfig{});

    Result<void> startServer();
    Result<void> setupSocket();
    // serves until the socket fails, or until maxClients connections were handled when non zero
    void acceptConnections(size_t maxClients = 0);
    // whole conversation with one client, the socket is closed on return
    void handleClient(int clientSocket);

    // bound port, differs from the requested one when it was 0
    int port() const { return port_; }

private:
    bool pushTransaction(int clientSocket);
    bool pullTransaction(int clientSocket);
    bool receiveRemotePath(int clientSocket, std::string& remotePath);
    bool reply(int clientSocket, bool status, const std::string& message);

    DeltaSync sync_;
    int port_;
    Socket serverSocket_;
    std::atomic<int> activeClients_;
    std::mutex mtx_;
    std::condition_variable cv_;
};
