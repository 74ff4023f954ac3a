#include "connection.hpp"
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>

namespace {
    std::string osError(const std::string& what) {
        return what + ": " + std::strerror(errno);
    }
}

Socket& Socket::operator=(Socket&& other) noexcept {
    if (this != &other) {
        close();
        fd_ = other.fd_;
        other.fd_ = -1;
    }
    return *this;
}

void Socket::close() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

Result<Socket> listenOn(int port, int backlog) {
    Socket server(socket(AF_INET, SOCK_STREAM, 0));
    if (!server.valid()) {
        return Result<Socket>::Error(ErrorKind::ConnectionFailed, osError("Socket creation failed"));
    }

    int opt = 1;
    if (setsockopt(server.fd(), SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt)) < 0) {
        return Result<Socket>::Error(ErrorKind::ConnectionFailed, osError("Set socket options failed"));
    }

    sockaddr_in serverAddr{};
    serverAddr.sin_family = AF_INET;
    serverAddr.sin_addr.s_addr = INADDR_ANY;
    serverAddr.sin_port = htons(static_cast<uint16_t>(port));

    if (bind(server.fd(), reinterpret_cast<sockaddr*>(&serverAddr), sizeof(serverAddr)) < 0) {
        return Result<Socket>::Error(ErrorKind::ConnectionFailed, osError("Bind failed"));
    }
    if (listen(server.fd(), backlog) < 0) {
        return Result<Socket>::Error(ErrorKind::ConnectionFailed, osError("Listen failed"));
    }
    return Result<Socket>::Ok(std::move(server));
}

Result<Socket> acceptClient(int listenFD, std::string& peer) {
    sockaddr_in clientAddr{};
    socklen_t addrLen = sizeof(clientAddr);
    int clientSocket;
    do {
        clientSocket = accept(listenFD, reinterpret_cast<sockaddr*>(&clientAddr), &addrLen);
    } while (clientSocket < 0 && errno == EINTR);
    if (clientSocket < 0) {
        return Result<Socket>::Error(ErrorKind::ConnectionFailed, osError("Accept failed"));
    }

    char clientIP[INET_ADDRSTRLEN] = {0};
    inet_ntop(AF_INET, &clientAddr.sin_addr, clientIP, INET_ADDRSTRLEN);
    peer = clientIP;
    return Result<Socket>::Ok(Socket(clientSocket));
}

Result<Socket> connectTo(const std::string& ip, int port) {
    sockaddr_in serverAddr{};
    serverAddr.sin_family = AF_INET;
    serverAddr.sin_port = htons(static_cast<uint16_t>(port));
    if (inet_pton(AF_INET, ip.c_str(), &serverAddr.sin_addr) != 1) {
        return Result<Socket>::Error(ErrorKind::ConnectionFailed, "Invalid address: " + ip);
    }

    Socket client(socket(AF_INET, SOCK_STREAM, 0));
    if (!client.valid()) {
        return Result<Socket>::Error(ErrorKind::ConnectionFailed, osError("Socket creation failed"));
    }
    if (connect(client.fd(), reinterpret_cast<sockaddr*>(&serverAddr), sizeof(serverAddr)) < 0) {
        return Result<Socket>::Error(ErrorKind::ConnectionFailed,
            osError("Connection to " + ip + ":" + std::to_string(port) + " failed"));
    }
    return Result<Socket>::Ok(std::move(client));
}

Result<int> localPort(int socketFD) {
    sockaddr_in addr{};
    socklen_t addrLen = sizeof(addr);
    if (getsockname(socketFD, reinterpret_cast<sockaddr*>(&addr), &addrLen) < 0) {
        return Result<int>::Error(ErrorKind::ConnectionFailed, osError("getsockname failed"));
    }
    return Result<int>::Ok(ntohs(addr.sin_port));
}
