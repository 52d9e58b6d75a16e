#pragma once

#include "session.hpp"

#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>

constexpr uint32_t kMaxFrameBytes = 16u * 1024u * 1024u;

// One connected stream socket. Owns the descriptor.
class TcpConnection {
public:
    TcpConnection() = default;
    TcpConnection(int fd, std::string peer);
    ~TcpConnection();

    TcpConnection(const TcpConnection&) = delete;
    TcpConnection& operator=(const TcpConnection&) = delete;
    TcpConnection(TcpConnection&& other) noexcept;
    TcpConnection& operator=(TcpConnection&& other) noexcept;

    bool is_open() const { return fd_ >= 0; }
    const std::string& peer() const { return peer_; }

    // Throws ConnectionClosed if the peer is gone
    void send_all(const uint8_t* data, std::size_t len);

    // Blocks until exactly `len` byte are read; throws ConnectionClosed otherwise
    void receive_exact(uint8_t* data, std::size_t len);

    // 4-byte big-endian length prefix + body. Returns bytes put on the wire.
    std::size_t send_frame(const std::vector<uint8_t>& body);

    // Throws ConnectionClosed, or ProtocolViolation for a length above kMaxFrameBytes
    std::vector<uint8_t> receive_frame();

    // Wakes up any thread blocked in send/recv on this socket
    void shutdown();

    void close();

private:
    int fd_ = -1;
    std::string peer_;
};

// Dials host:port; throws BindOrConnectFailure
TcpConnection connect_tcp(const std::string& host, int port);

class TcpListener {
public:
    // Binds and listens; port 0 picks an ephemeral port. Throws BindOrConnectFailure.
    TcpListener(const std::string& host, int port);
    ~TcpListener();

    TcpListener(const TcpListener&) = delete;
    TcpListener& operator=(const TcpListener&) = delete;

    // Waits for one peer, polling the token; throws BindOrConnectFailure if
    // the listener failed or the wait was cancelled
    TcpConnection accept(const CancellationToken& cancel);

    int port() const { return port_; }

private:
    int fd_ = -1;
    int port_ = 0;
};
