#pragma once
#include <string>
#include "../common/result.hpp"

// owns one socket descriptor, closed on destruction
class Socket {
public:
    explicit Socket(int fd = -1) : fd_(fd) {}
    ~Socket() { close(); }

    Socket(Socket&& other) noexcept : fd_(other.fd_) { other.fd_ = -1; }
    Socket& operator=(Socket&& other) noexcept;
    Socket(const Socket&) = delete;
    Socket& operator=(const Socket&) = delete;

    int fd() const { return fd_; }
    bool valid() const { return fd_ >= 0; }
    void close();

private:
    int fd_;
};

// listening TCP socket on all interfaces, port 0 picks a free port
Result<Socket> listenOn(int port, int backlog);
// blocks for the next client, peer receives its dotted address
Result<Socket> acceptClient(int listenFD, std::string& peer);
Result<Socket> connectTo(const std::string& ip, int port);
// port a socket is bound to
Result<int> localPort(int socketFD);
