#pragma once

// ============================================================
// server_app.hpp -- tws: serve one payload to one client
//
// run() is a straight line of steps, each of which may throw:
//   open_source()      file (normal mode) or stdin pipe (streaming)
//   resolve_mime()     -m, else `file --mime-type`, else default
//   resolve_url_path() -f, else URL-escaped basename of the name
//   start_listening()  dual-stack socket, backlog 1
//   announce_urls()    candidate URLs for the operator
//   serve()            accept once, read request, respond, transfer
// The listening socket is closed as soon as the client is accepted.
// ============================================================

#include "../common/platform.hpp"
#include "../common/socket.hpp"
#include "byte_source.hpp"
#include "options.hpp"
#include <functional>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

static constexpr u16 RANDOM_PORT_FIRST = 8000;
static constexpr u16 RANDOM_PORT_LAST  = 8999;

// Lines listing where the payload can be fetched from. 'addrs' are host
// names, IPv4 addresses or bracketed IPv6 addresses.
std::vector<std::string> candidate_urls(const std::string& user_url,
                                        const std::vector<std::string>& addrs,
                                        u16 port,
                                        const std::string& url_path);

class ServerApp {
public:
    // Called once the socket listens, with the actual port
    using ListeningCallback = std::function<void(u16 port)>;

    // 'input_fd' is where a streamed payload comes from (stdin normally)
    explicit ServerApp(ServerConfig config,
                       std::ostream& out = std::cout,
                       int input_fd = STDIN_FILENO);

    // Blocks until the transfer is complete. Returns the exit status.
    // Throws SetupError, ProtocolError or TransportError.
    int run();

    void set_listening_callback(ListeningCallback cb) { on_listening_ = std::move(cb); }

    bool streaming() const { return streaming_; }
    const std::string& mime_type() const { return mime_; }
    const std::string& url_path() const { return url_path_; }
    u16 port() const { return port_; }

private:
    ServerConfig                config_;
    std::ostream&               out_;
    int                         input_fd_;
    ListeningCallback           on_listening_;

    bool                        streaming_{false};
    std::unique_ptr<ByteSource> source_;
    std::string                 mime_;
    std::string                 url_path_;
    u16                         port_{0};
    TcpSocket                   listen_sock_;

    void open_source();
    void resolve_mime();
    void resolve_url_path();
    void start_listening();
    void announce_urls();
    void serve();
};
