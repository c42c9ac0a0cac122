// ============================================================
// http_response.cpp -- ResponseFramer implementation
// ============================================================

#include "http_response.hpp"
#include "../common/utils.hpp"
#include <stdexcept>

std::string ResponseFramer::build_head(TransferMode mode,
                                       const std::string& mime,
                                       i64 total_bytes) {
    std::string head;
    head += "HTTP/1.1 200 Ok\r\n";
    head += "Content-Type: " + mime + "\r\n";
    head += std::string("Server: ") + SERVER_NAME + "\r\n";
    if (mode == TransferMode::FixedLength) {
        head += "Content-Length: " + std::to_string(total_bytes) + "\r\n";
    } else {
        head += "Transfer-Encoding: chunked\r\n";
    }
    head += "\r\n";
    return head;
}

std::string ResponseFramer::chunk_header(size_t len) {
    return utils::to_hex((u64)len) + "\r\n";
}

void ResponseFramer::send_head() {
    if (session_.header_sent) {
        throw std::logic_error("response header already sent");
    }
    out_.write(build_head(session_.mode, session_.mime_type, session_.total_bytes));
    session_.header_sent = true;
    session_.chunk_framing_open = session_.streaming();
}

void ResponseFramer::send_payload(const void* data, size_t len) {
    if (!session_.header_sent) {
        throw std::logic_error("payload before response header");
    }
    if (len == 0) return;

    if (session_.streaming()) {
        if (!session_.chunk_framing_open) {
            throw std::logic_error("chunk after terminating chunk");
        }
        out_.write(chunk_header(len));
        out_.write(data, len);
        out_.write("\r\n", 2);
    } else {
        out_.write(data, len);
    }
}

void ResponseFramer::send_trailer() {
    if (!session_.chunk_framing_open) {
        throw std::logic_error("no open chunked body to terminate");
    }
    out_.write(CHUNK_TERMINATOR, 5);
    session_.chunk_framing_open = false;
}
