#pragma once

// ============================================================
// transfer_loop.hpp -- Moves the payload from source to client
//
// One cycle:
//   WAIT_READY   poll the source for at most the refresh interval
//   READ_SOURCE  read up to buffer_size bytes (never past Content-Length)
//   FRAME+WRITE  hand the bytes to ResponseFramer
//   IDLE_TICK    on timeout nothing is written
//   then rate/ETA accounting and, every refresh interval, a redraw.
// EOF (or reaching Content-Length) leads to FINALIZE: terminating
// chunk if streaming, flush, and one last progress line showing the
// total elapsed time.
//
// Single-threaded: the bounded poll is the only thing that lets the
// progress bar move while a pipe is idle.
// ============================================================

#include "../common/platform.hpp"
#include "../common/progress.hpp"
#include "byte_source.hpp"
#include "http_response.hpp"
#include "transfer_session.hpp"
#include <chrono>
#include <vector>

class TransferLoop {
public:
    static constexpr std::chrono::milliseconds DEFAULT_REFRESH{300};

    TransferLoop(TransferSession& session,
                 ByteSource& source,
                 ResponseFramer& framer,
                 ProgressRenderer& progress,
                 std::chrono::milliseconds refresh = DEFAULT_REFRESH);

    // Runs until the source is exhausted. The response head must already
    // have been sent. Throws TransportError on read/write failure or if a
    // fixed-length source ends early.
    void run();

    // Seconds from start to the end of FINALIZE (valid after run())
    double elapsed_s() const { return elapsed_s_; }

private:
    TransferSession&          session_;
    ByteSource&               source_;
    ResponseFramer&           framer_;
    ProgressRenderer&         progress_;
    std::chrono::milliseconds refresh_;
    std::vector<char>         buf_;
    double                    elapsed_s_{0.0};

    // Read one cycle's worth; returns false at end of source
    bool pull(size_t& got);

    void account(TransferSession::clock::time_point now);
    void finalize();
};
