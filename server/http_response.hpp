#pragma once

// ============================================================
// http_response.hpp -- Status line, headers and chunk framing
//
//   HTTP/1.1 200 Ok
//   Content-Type: <mime>
//   Server: tws (not a real server)
//   Content-Length: <n>            | Transfer-Encoding: chunked
//
// In chunked mode every payload piece goes out as
// "<hex-size>\r\n<bytes>\r\n" and the body ends with "0\r\n\r\n".
// ============================================================

#include "../common/platform.hpp"
#include "../common/write_buffer.hpp"
#include "transfer_session.hpp"
#include <string>

class ResponseFramer {
public:
    static constexpr const char* SERVER_NAME      = "tws (not a real server)";
    static constexpr const char* CHUNK_TERMINATOR = "0\r\n\r\n";

    ResponseFramer(TcpWriteBuffer& out, TransferSession& session)
        : out_(out), session_(session) {}

    // Write the header block. Must be called exactly once, before any
    // payload; opens chunk framing in streaming mode.
    void send_head();

    // Write one piece of payload, framed per the session mode.
    // Empty pieces are skipped so no premature 0-chunk can appear.
    void send_payload(const void* data, size_t len);

    // Streaming only: write the terminating 0-chunk and close framing
    void send_trailer();

    void flush() { out_.flush(); }

    static std::string build_head(TransferMode mode,
                                  const std::string& mime,
                                  i64 total_bytes);

    // "<lowercase hex>\r\n"
    static std::string chunk_header(size_t len);

private:
    TcpWriteBuffer&  out_;
    TransferSession& session_;
};
