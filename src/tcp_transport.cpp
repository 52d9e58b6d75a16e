#include "tcp_transport.hpp"
#include "packet_parser.hpp"
#include "stream_errors.hpp"
#include <sys/socket.h>
#include <sys/types.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <arpa/inet.h>
#include <netdb.h>
#include <unistd.h>
#include <poll.h>
#include <cerrno>
#include <cstring>
#include <iostream>
#include <utility>

namespace {

constexpr int ACCEPT_POLL_MS = 100;

std::string errno_text(const std::string& what) {
    return what + ": " + std::strerror(errno);
}

std::string describe_peer(const sockaddr_storage& addr) {
    char host[NI_MAXHOST] = {0};
    char serv[NI_MAXSERV] = {0};
    if (getnameinfo(reinterpret_cast<const sockaddr*>(&addr), sizeof(addr), host, sizeof(host),
                    serv, sizeof(serv), NI_NUMERICHOST | NI_NUMERICSERV) != 0)
        return "unknown";
    return std::string(host) + ":" + serv;
}

struct AddrInfoList {
    addrinfo* head = nullptr;
    ~AddrInfoList() { if (head) freeaddrinfo(head); }
};

void resolve(const std::string& host, int port, bool passive, AddrInfoList& out) {
    addrinfo hints{};
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;
    if (passive) hints.ai_flags = AI_PASSIVE;

    const char* node = host.empty() ? nullptr : host.c_str();
    std::string service = std::to_string(port);
    int rc = getaddrinfo(node, service.c_str(), &hints, &out.head);
    if (rc != 0)
        throw BindOrConnectFailure("cannot resolve " + host + ":" + service + ": " + gai_strerror(rc));
}

} // namespace

// ---------------------- TcpConnection ----------------------

TcpConnection::TcpConnection(int fd, std::string peer) : fd_(fd), peer_(std::move(peer)) {}

TcpConnection::~TcpConnection() {
    close();
}

TcpConnection::TcpConnection(TcpConnection&& other) noexcept
    : fd_(std::exchange(other.fd_, -1)), peer_(std::move(other.peer_)) {}

TcpConnection& TcpConnection::operator=(TcpConnection&& other) noexcept {
    if (this != &other) {
        close();
        fd_ = std::exchange(other.fd_, -1);
        peer_ = std::move(other.peer_);
    }
    return *this;
}

void TcpConnection::send_all(const uint8_t* data, std::size_t len) {
    if (fd_ < 0) throw ConnectionClosed("send on a closed connection");

    std::size_t sent = 0;
    while (sent < len) {
        ssize_t n = ::send(fd_, data + sent, len - sent, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            throw ConnectionClosed(errno_text("send to " + peer_ + " failed"));
        }
        sent += static_cast<std::size_t>(n);
    }
}

void TcpConnection::receive_exact(uint8_t* data, std::size_t len) {
    if (fd_ < 0) throw ConnectionClosed("receive on a closed connection");

    std::size_t got = 0;
    while (got < len) {
        ssize_t n = ::recv(fd_, data + got, len - got, 0);
        if (n == 0)
            throw ConnectionClosed("connection closed by " + peer_);
        if (n < 0) {
            if (errno == EINTR) continue;
            throw ConnectionClosed(errno_text("receive from " + peer_ + " failed"));
        }
        got += static_cast<std::size_t>(n);
    }
}

std::size_t TcpConnection::send_frame(const std::vector<uint8_t>& body) {
    if (body.size() > kMaxFrameBytes)
        throw ProtocolViolation("frame of " + std::to_string(body.size()) + " byte exceeds limit");

    std::vector<uint8_t> frame;
    frame.reserve(4 + body.size());
    put_u32(frame, static_cast<uint32_t>(body.size()));
    frame.insert(frame.end(), body.begin(), body.end());

    send_all(frame.data(), frame.size());
    return frame.size();
}

std::vector<uint8_t> TcpConnection::receive_frame() {
    uint8_t prefix[4];
    receive_exact(prefix, sizeof(prefix));

    uint32_t len = get_u32(prefix);
    if (len > kMaxFrameBytes)
        throw ProtocolViolation("frame length " + std::to_string(len) + " exceeds limit");

    std::vector<uint8_t> body(len);
    if (len > 0) receive_exact(body.data(), len);
    return body;
}

void TcpConnection::shutdown() {
    if (fd_ >= 0) ::shutdown(fd_, SHUT_RDWR);
}

void TcpConnection::close() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

TcpConnection connect_tcp(const std::string& host, int port) {
    AddrInfoList addrs;
    resolve(host, port, false, addrs);

    std::string last_error = "no address";
    for (addrinfo* ai = addrs.head; ai; ai = ai->ai_next) {
        int sock = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (sock < 0) {
            last_error = errno_text("socket");
            continue;
        }
        if (::connect(sock, ai->ai_addr, ai->ai_addrlen) == 0) {
            int nodelay = 1;
            setsockopt(sock, IPPROTO_TCP, TCP_NODELAY, &nodelay, sizeof(nodelay));

            sockaddr_storage peer{};
            std::memcpy(&peer, ai->ai_addr, ai->ai_addrlen);
            std::cout << "[tcp] Connected to " << host << ":" << port << std::endl;
            return TcpConnection(sock, describe_peer(peer));
        }
        last_error = errno_text("connect");
        ::close(sock);
    }

    throw BindOrConnectFailure("cannot connect to " + host + ":" + std::to_string(port) + " (" + last_error + ")");
}

// ---------------------- TcpListener ----------------------

TcpListener::TcpListener(const std::string& host, int port) {
    AddrInfoList addrs;
    resolve(host, port, true, addrs);

    std::string last_error = "no address";
    for (addrinfo* ai = addrs.head; ai; ai = ai->ai_next) {
        int sock = socket(ai->ai_family, ai->ai_socktype, ai->ai_protocol);
        if (sock < 0) {
            last_error = errno_text("socket");
            continue;
        }

        int optval = 1;
        setsockopt(sock, SOL_SOCKET, SO_REUSEADDR, &optval, sizeof(optval));
        setsockopt(sock, SOL_SOCKET, SO_REUSEPORT, &optval, sizeof(optval));

        if (bind(sock, ai->ai_addr, ai->ai_addrlen) < 0) {
            last_error = errno_text("bind");
            ::close(sock);
            continue;
        }
        if (listen(sock, 1) < 0) {
            last_error = errno_text("listen");
            ::close(sock);
            continue;
        }

        sockaddr_storage bound{};
        socklen_t bound_len = sizeof(bound);
        if (getsockname(sock, reinterpret_cast<sockaddr*>(&bound), &bound_len) == 0) {
            if (bound.ss_family == AF_INET)
                port_ = ntohs(reinterpret_cast<sockaddr_in*>(&bound)->sin_port);
            else if (bound.ss_family == AF_INET6)
                port_ = ntohs(reinterpret_cast<sockaddr_in6*>(&bound)->sin6_port);
        }

        fd_ = sock;
        std::cout << "[tcp] Listening on " << (host.empty() ? "*" : host) << ":" << port_ << std::endl;
        return;
    }

    throw BindOrConnectFailure("cannot listen on " + host + ":" + std::to_string(port) + " (" + last_error + ")");
}

TcpListener::~TcpListener() {
    if (fd_ >= 0) ::close(fd_);
}

TcpConnection TcpListener::accept(const CancellationToken& cancel) {
    while (!cancel.cancelled()) {
        pollfd pfd{};
        pfd.fd = fd_;
        pfd.events = POLLIN;
        int ready = ::poll(&pfd, 1, ACCEPT_POLL_MS);
        if (ready < 0) {
            if (errno == EINTR) continue;
            throw BindOrConnectFailure(errno_text("poll on listener failed"));
        }
        if (ready == 0) continue;

        sockaddr_storage peer{};
        socklen_t peer_len = sizeof(peer);
        int sock = ::accept(fd_, reinterpret_cast<sockaddr*>(&peer), &peer_len);
        if (sock >= 0) {
            int nodelay = 1;
            setsockopt(sock, IPPROTO_TCP, TCP_NODELAY, &nodelay, sizeof(nodelay));
            std::string who = describe_peer(peer);
            std::cout << "[tcp] Accepted connection from " << who << std::endl;
            return TcpConnection(sock, who);
        }
        if (errno == EINTR || errno == EAGAIN || errno == ECONNABORTED) continue;
        throw BindOrConnectFailure(errno_text("accept failed"));
    }
    throw BindOrConnectFailure("accept cancelled");
}
