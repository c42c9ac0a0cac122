#pragma once

// ============================================================
// http_request.hpp -- Reads the one request a client sends
//
// Only "GET <path> HTTP/<version>" is accepted. The remaining
// header lines are collected verbatim (for -v) and otherwise
// ignored; the request ends at the first line that is exactly
// "\r\n". No read timeout is applied.
// ============================================================

#include "../common/platform.hpp"
#include "../common/socket.hpp"
#include <string>
#include <vector>

struct HttpRequest {
    std::string              request_line;  // as received, CRLF included
    std::string              method;
    std::string              path;
    std::string              version;       // e.g. "HTTP/1.1"
    std::vector<std::string> header_lines;  // as received, CRLF included
};

class RequestReader {
public:
    static constexpr size_t MAX_LINE_LEN     = 8192;
    static constexpr size_t MAX_HEADER_LINES = 256;

    explicit RequestReader(TcpSocket& sock) : sock_(sock) {}

    // Blocks until the whole header block has arrived.
    // Throws ProtocolError on anything that is not a GET request or
    // if the peer closes before the blank line; TransportError on
    // socket errors.
    HttpRequest read();

    // Split a raw request line into method/path/version.
    // Returns false unless it is a well-formed GET line ending in CRLF.
    static bool parse_request_line(const std::string& line, HttpRequest& req);

private:
    TcpSocket&  sock_;
    std::string buf_;
    size_t      pos_{0};

    // Next line including its '\n'; false if the peer closed first
    bool read_line(std::string& line);
};
