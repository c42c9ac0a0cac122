// ============================================================
// http_request.cpp -- RequestReader implementation
// ============================================================

#include "http_request.hpp"
#include "../common/errors.hpp"
#include "../common/logger.hpp"

bool RequestReader::read_line(std::string& line) {
    for (;;) {
        size_t nl = buf_.find('\n', pos_);
        if (nl != std::string::npos) {
            line.assign(buf_, pos_, nl + 1 - pos_);
            pos_ = nl + 1;
            return true;
        }
        if (buf_.size() - pos_ > MAX_LINE_LEN) {
            throw ProtocolError("Request line too long");
        }

        // compact before reading more
        if (pos_ > 0) {
            buf_.erase(0, pos_);
            pos_ = 0;
        }

        char chunk[2048];
        size_t n = sock_.recv_some(chunk, sizeof(chunk));
        if (n == 0) return false;
        buf_.append(chunk, n);
    }
}

bool RequestReader::parse_request_line(const std::string& line, HttpRequest& req) {
    if (line.size() < 2 || line.compare(line.size() - 2, 2, "\r\n") != 0) {
        return false;
    }
    std::string body = line.substr(0, line.size() - 2);

    size_t sp1 = body.find(' ');
    if (sp1 == std::string::npos) return false;
    size_t sp2 = body.find(' ', sp1 + 1);
    if (sp2 == std::string::npos) return false;
    if (body.find(' ', sp2 + 1) != std::string::npos) return false;

    std::string method  = body.substr(0, sp1);
    std::string path    = body.substr(sp1 + 1, sp2 - sp1 - 1);
    std::string version = body.substr(sp2 + 1);

    if (method != "GET") return false;
    if (path.empty()) return false;
    if (version.size() <= 5 || version.compare(0, 5, "HTTP/") != 0) return false;

    req.request_line = line;
    req.method       = method;
    req.path         = path;
    req.version      = version;
    return true;
}

HttpRequest RequestReader::read() {
    HttpRequest req;

    std::string line;
    if (!read_line(line)) {
        throw ProtocolError("Client closed the connection without sending a request");
    }
    if (!parse_request_line(line, req)) {
        LOG_DEBUG("Rejected request line: " + line.substr(0, 200));
        throw ProtocolError("Invalid request received, terminating");
    }

    // read the rest of the request and throw it away
    for (;;) {
        if (!read_line(line)) {
            throw ProtocolError("Client closed the connection before the end of the request headers");
        }
        if (line == "\r\n") break;
        if (req.header_lines.size() >= MAX_HEADER_LINES) {
            throw ProtocolError("Too many request header lines");
        }
        req.header_lines.push_back(line);
    }
    return req;
}
