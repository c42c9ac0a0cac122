#pragma once

// ============================================================
// socket.hpp -- RAII TCP socket wrapper
// ============================================================

#include "platform.hpp"
#include <string>

// Resolved address of the remote end of an accepted connection
struct PeerInfo {
    std::string ip;      // textual, IPv4-mapped prefix stripped
    std::string name;    // reverse lookup result, empty if unresolved
    u16         port{0};
};

class TcpSocket {
public:
    TcpSocket() = default;
    explicit TcpSocket(socket_t fd);
    ~TcpSocket();

    // Non-copyable
    TcpSocket(const TcpSocket&) = delete;
    TcpSocket& operator=(const TcpSocket&) = delete;

    // Movable
    TcpSocket(TcpSocket&& o) noexcept;
    TcpSocket& operator=(TcpSocket&& o) noexcept;

    // Server: create an IPv6 socket that also accepts IPv4-mapped peers,
    // bind the wildcard address and listen. Port 0 picks an ephemeral port.
    // Throws SetupError.
    void bind_and_listen(u16 port, int backlog = 1);

    // Accept one connection (blocking). Throws SetupError.
    TcpSocket accept();

    // Send exactly 'len' bytes; throws TransportError on error
    void send_all(const void* buf, size_t len);

    // Receive up to 'len' bytes; returns 0 on clean close.
    // Throws TransportError on error.
    size_t recv_some(void* buf, size_t len);

    // Disable Nagle so every small write leaves immediately.
    // Returns false if the option could not be set.
    bool set_nodelay(bool on);

    bool is_valid() const { return fd_ != INVALID_SOCKET_VAL; }
    socket_t native() const { return fd_; }

    void close();

    // Port this socket is bound to (0 if unknown)
    u16 local_port() const;

    // Peer address; reverse-resolves the name when 'resolve' is set
    PeerInfo peer_info(bool resolve) const;

private:
    socket_t fd_{INVALID_SOCKET_VAL};
};

// "::ffff:10.0.0.1" -> "10.0.0.1"; anything else is returned unchanged
std::string strip_v4_mapped(const std::string& ip);
