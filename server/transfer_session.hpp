#pragma once

// ============================================================
// transfer_session.hpp -- State of the single transfer of a run
//
// Mode, total size, buffer size and MIME type are fixed at
// construction. The counters are advanced only by ResponseFramer
// (header/chunk flags) and TransferLoop (bytes, clocks, intervals).
// ============================================================

#include "../common/platform.hpp"
#include "../common/progress.hpp"
#include "../common/hash.hpp"
#include <string>
#include <chrono>

struct TransferSession {
    using clock = std::chrono::steady_clock;

    // Throws std::invalid_argument if buffer_size is 0 or the total does
    // not match the mode (-1 for Streaming, >= 0 for FixedLength).
    TransferSession(TransferMode mode, i64 total_bytes,
                    size_t buffer_size, std::string mime_type);

    TransferSession(const TransferSession&) = delete;
    TransferSession& operator=(const TransferSession&) = delete;

    const TransferMode mode;
    const i64          total_bytes;   // -1 when streaming
    const size_t       buffer_size;
    const std::string  mime_type;

    u64                sent_bytes{0};
    clock::time_point  start_time{};
    clock::time_point  last_progress_time{};
    u64                interval_count{0};

    bool               header_sent{false};
    bool               chunk_framing_open{false};

    u64                write_cycles{0};   // non-empty payload writes
    hash::StreamHasher64 digest;          // xxh3_64 of the payload

    bool streaming() const { return mode == TransferMode::Streaming; }

    // Bytes left before Content-Length is reached (streaming: unlimited)
    u64 remaining() const;

    // Account 'len' payload bytes that were just written
    void record_sent(const void* data, size_t len);

    // Average bytes/s since start; 0 while no time has passed
    double throughput(double elapsed_s) const;

    // Fixed-length: extrapolated time left, 0 until the first byte.
    // Streaming: the elapsed time itself.
    double display_time(double elapsed_s) const;

    ProgressFrame frame(double time_s, double speed) const;
};
