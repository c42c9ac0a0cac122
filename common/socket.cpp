// ============================================================
// socket.cpp -- TcpSocket implementation
// ============================================================

#include "socket.hpp"
#include "errors.hpp"
#include <cstdlib>
#include <cstring>
#include <string>

TcpSocket::TcpSocket(socket_t fd) : fd_(fd) {}

TcpSocket::~TcpSocket() {
    close();
}

TcpSocket::TcpSocket(TcpSocket&& o) noexcept : fd_(o.fd_) {
    o.fd_ = INVALID_SOCKET_VAL;
}

TcpSocket& TcpSocket::operator=(TcpSocket&& o) noexcept {
    if (this != &o) {
        close();
        fd_ = o.fd_;
        o.fd_ = INVALID_SOCKET_VAL;
    }
    return *this;
}

void TcpSocket::bind_and_listen(u16 port, int backlog) {
    close();

    fd_ = ::socket(AF_INET6, SOCK_STREAM, IPPROTO_TCP);
    if (fd_ == INVALID_SOCKET_VAL) {
        throw SetupError("socket: " + socket_error_str(last_socket_error()));
    }

    int on = 1;
    if (setsockopt(fd_, SOL_SOCKET, SO_REUSEADDR, &on, sizeof(on)) == SOCKET_ERROR_VAL) {
        throw SetupError("setsockopt(SO_REUSEADDR): " + socket_error_str(last_socket_error()));
    }

    // allow v4 clients as well
    int off = 0;
    if (setsockopt(fd_, IPPROTO_IPV6, IPV6_V6ONLY, &off, sizeof(off)) == SOCKET_ERROR_VAL) {
        throw SetupError("setsockopt(IPV6_V6ONLY): " + socket_error_str(last_socket_error()));
    }

    sockaddr_in6 addr{};
    addr.sin6_family = AF_INET6;
    addr.sin6_port   = htons(port);
    addr.sin6_addr   = in6addr_any;
    if (::bind(fd_, (sockaddr*)&addr, sizeof(addr)) == SOCKET_ERROR_VAL) {
        throw SetupError("bind: " + socket_error_str(last_socket_error()));
    }
    if (::listen(fd_, backlog) == SOCKET_ERROR_VAL) {
        throw SetupError("listen: " + socket_error_str(last_socket_error()));
    }
}

TcpSocket TcpSocket::accept() {
    for (;;) {
        sockaddr_storage peer{};
        socklen_t peer_len = sizeof(peer);
        socket_t client = ::accept(fd_, (sockaddr*)&peer, &peer_len);
        if (client != INVALID_SOCKET_VAL) {
            return TcpSocket(client);
        }
        int err = last_socket_error();
        if (err == EINTR) continue;
        throw SetupError("accept: " + socket_error_str(err));
    }
}

void TcpSocket::send_all(const void* buf, size_t len) {
    const char* p = static_cast<const char*>(buf);
    size_t remaining = len;
    while (remaining > 0) {
        ssize_t sent = ::send(fd_, p, remaining, MSG_NOSIGNAL);
        if (sent <= 0) {
            if (sent == 0) {
                throw TransportError("Connection closed during send");
            }
            int err = last_socket_error();
            if (err == EINTR) continue;
            if (err == EPIPE) {
                throw TransportError("Broken pipe, terminating");
            }
            throw TransportError("Error writing to client: " + socket_error_str(err));
        }
        p += sent;
        remaining -= static_cast<size_t>(sent);
    }
}

size_t TcpSocket::recv_some(void* buf, size_t len) {
    for (;;) {
        ssize_t received = ::recv(fd_, buf, len, 0);
        if (received >= 0) return static_cast<size_t>(received);
        int err = last_socket_error();
        if (err == EINTR) continue;
        throw TransportError("recv: " + socket_error_str(err));
    }
}

bool TcpSocket::set_nodelay(bool on) {
    int v = on ? 1 : 0;
    return setsockopt(fd_, IPPROTO_TCP, TCP_NODELAY, &v, sizeof(v)) != SOCKET_ERROR_VAL;
}

void TcpSocket::close() {
    if (fd_ != INVALID_SOCKET_VAL) {
        CLOSE_SOCKET(fd_);
        fd_ = INVALID_SOCKET_VAL;
    }
}

u16 TcpSocket::local_port() const {
    sockaddr_storage local{};
    socklen_t len = sizeof(local);
    if (getsockname(fd_, (sockaddr*)&local, &len) != 0) return 0;
    if (local.ss_family == AF_INET6) {
        return ntohs(reinterpret_cast<sockaddr_in6*>(&local)->sin6_port);
    }
    if (local.ss_family == AF_INET) {
        return ntohs(reinterpret_cast<sockaddr_in*>(&local)->sin_port);
    }
    return 0;
}

PeerInfo TcpSocket::peer_info(bool resolve) const {
    PeerInfo info;
    sockaddr_storage peer{};
    socklen_t len = sizeof(peer);
    if (getpeername(fd_, (sockaddr*)&peer, &len) != 0) {
        info.ip = "unknown";
        return info;
    }

    char host[NI_MAXHOST] = {0};
    char serv[NI_MAXSERV] = {0};
    if (getnameinfo((sockaddr*)&peer, len, host, sizeof(host), serv, sizeof(serv),
                    NI_NUMERICHOST | NI_NUMERICSERV) == 0) {
        info.ip   = strip_v4_mapped(host);
        info.port = (u16)std::atoi(serv);
    } else {
        info.ip = "unknown";
    }

    if (resolve) {
        char name[NI_MAXHOST] = {0};
        if (getnameinfo((sockaddr*)&peer, len, name, sizeof(name), nullptr, 0,
                        NI_NAMEREQD) == 0) {
            info.name = name;
        }
    }
    return info;
}

std::string strip_v4_mapped(const std::string& ip) {
    static const std::string prefix = "::ffff:";
    if (ip.size() > prefix.size() &&
        ip.compare(0, prefix.size(), prefix) == 0 &&
        ip.find('.', prefix.size()) != std::string::npos) {
        return ip.substr(prefix.size());
    }
    return ip;
}
