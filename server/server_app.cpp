// ============================================================
// server_app.cpp -- tws server implementation
// ============================================================

#include "server_app.hpp"
#include "host_probe.hpp"
#include "http_request.hpp"
#include "http_response.hpp"
#include "transfer_loop.hpp"
#include "transfer_session.hpp"
#include "../common/errors.hpp"
#include "../common/hash.hpp"
#include "../common/logger.hpp"
#include "../common/progress.hpp"
#include "../common/utils.hpp"
#include "../common/write_buffer.hpp"
#include <random>

std::vector<std::string> candidate_urls(const std::string& user_url,
                                        const std::vector<std::string>& addrs,
                                        u16 port,
                                        const std::string& url_path) {
    std::vector<std::string> urls;
    if (!user_url.empty()) {
        urls.push_back("*** http://" + user_url + "/" + url_path);
    }
    for (const auto& a : addrs) {
        urls.push_back("http://" + a + ":" + std::to_string(port) + "/" + url_path);
    }
    return urls;
}

ServerApp::ServerApp(ServerConfig config, std::ostream& out, int input_fd)
    : config_(std::move(config))
    , out_(out)
    , input_fd_(input_fd)
{}

int ServerApp::run() {
    open_source();
    resolve_mime();
    resolve_url_path();
    start_listening();
    announce_urls();
    serve();
    return 0;
}

void ServerApp::open_source() {
    streaming_ = ByteSource::is_pipe(input_fd_);
    if (streaming_) {
        source_ = std::make_unique<ByteSource>(ByteSource::from_stream(input_fd_, false));
        LOG_DEBUG("Standard input is a pipe, streaming mode");
        return;
    }

    source_ = std::make_unique<ByteSource>(ByteSource::open_file(config_.name));
    if (source_->is_stream()) {
        // not a regular file (device node): size unknown, send chunked
        streaming_ = true;
        LOG_WARN(config_.name + " is not a regular file, sending it chunked");
    }
}

void ServerApp::resolve_mime() {
    mime_ = host::DEFAULT_MIME;
    if (!config_.mime_override.empty()) {
        mime_ = config_.mime_override;
        return;
    }
    if (!ByteSource::is_pipe(input_fd_)) {
        std::string detected;
        if (host::detect_mime(config_.name, detected)) {
            mime_ = detected;
        }
    }
}

void ServerApp::resolve_url_path() {
    if (!config_.url_file.empty()) {
        url_path_ = config_.url_file;
    } else {
        url_path_ = host::url_escape(utils::basename(config_.name));
    }
}

void ServerApp::start_listening() {
    port_ = config_.port;
    if (port_ == 0) {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<int> dist(RANDOM_PORT_FIRST, RANDOM_PORT_LAST);
        port_ = (u16)dist(gen);
    }

    listen_sock_.bind_and_listen(port_, 1);
    LOG_DEBUG("Listening socket bound to port " + std::to_string(port_));

    if (on_listening_) on_listening_(port_);
}

void ServerApp::announce_urls() {
    out_ << "Listening on port " << port_
         << (streaming_ ? " (streaming mode)" : "")
         << ", MIME type is " << mime_ << "\n\n";

    out_ << "Possible URLs that should work to retrieve the file:\n\n";

    std::vector<std::string> addrs =
        host::discover_addresses(config_.all_addresses, config_.resolve);
    std::vector<std::string> urls = candidate_urls(config_.user_url, addrs, port_, url_path_);

    if (!config_.user_url.empty()) {
        out_ << urls.front() << "\n";
    }
    if (!addrs.empty()) {
        for (size_t i = config_.user_url.empty() ? 0 : 1; i < urls.size(); ++i) {
            out_ << urls[i] << "\n";
        }
    } else {
        out_ << "Cannot determine more URLs.\n"
             << "Use an URL like http://some.address.or.name:" << port_ << "/" << url_path_ << ",\n"
             << "where 'some.address.or.name' is an address or a name that eventually"
             << " gets traffic to a local IP address\n";
    }
    out_ << "\n";
    out_.flush();
}

void ServerApp::serve() {
    TcpSocket conn = listen_sock_.accept();
    listen_sock_.close();  // single shot: no second accept

    PeerInfo peer = conn.peer_info(config_.resolve);
    out_ << "Client connected: " << peer.ip << " ("
         << (peer.name.empty() ? "unknown" : peer.name) << ") from port "
         << peer.port << "\n";
    out_.flush();

    int term_width = host::terminal_width();

    if (config_.unbuffered && !conn.set_nodelay(true)) {
        LOG_WARN("Cannot disable Nagle's algorithm: " + socket_error_str(last_socket_error()));
    }

    RequestReader reader(conn);
    HttpRequest req = reader.read();

    if (config_.verbose) {
        out_ << "\n" << req.request_line;
        for (const auto& line : req.header_lines) out_ << line;
        out_ << "\n";
        out_.flush();
    }

    TransferMode mode = streaming_ ? TransferMode::Streaming : TransferMode::FixedLength;
    TransferSession session(mode, source_->total_bytes(), config_.buffer_size, mime_);

    TcpWriteBuffer wbuf(conn, config_.unbuffered ? 0 : TcpWriteBuffer::DEFAULT_THRESHOLD);
    ResponseFramer framer(wbuf, session);
    framer.send_head();

    ProgressRenderer progress(out_, term_width);
    TransferLoop loop(session, *source_, framer, progress);
    loop.run();

    LOG_INFO("Sent " + utils::commify(session.sent_bytes) + " bytes, xxh3 " +
             hash::to_hex(session.digest.digest()));

    source_->close();
}
