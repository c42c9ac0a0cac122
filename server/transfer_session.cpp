// ============================================================
// transfer_session.cpp -- TransferSession accounting
// ============================================================

#include "transfer_session.hpp"
#include <limits>
#include <stdexcept>
#include <utility>

TransferSession::TransferSession(TransferMode mode_, i64 total_bytes_,
                                 size_t buffer_size_, std::string mime_type_)
    : mode(mode_)
    , total_bytes(total_bytes_)
    , buffer_size(buffer_size_)
    , mime_type(std::move(mime_type_))
{
    if (buffer_size == 0) {
        throw std::invalid_argument("buffer size must be positive");
    }
    if (mode == TransferMode::Streaming && total_bytes != -1) {
        throw std::invalid_argument("streaming session must have an unknown total");
    }
    if (mode == TransferMode::FixedLength && total_bytes < 0) {
        throw std::invalid_argument("fixed-length session needs a known total");
    }
    start_time = last_progress_time = clock::now();
}

u64 TransferSession::remaining() const {
    if (streaming()) return std::numeric_limits<u64>::max();
    u64 total = (u64)total_bytes;
    return sent_bytes >= total ? 0 : total - sent_bytes;
}

void TransferSession::record_sent(const void* data, size_t len) {
    if (len > remaining()) {
        throw std::logic_error("payload would exceed Content-Length");
    }
    sent_bytes += len;
    ++write_cycles;
    digest.update(data, len);
}

double TransferSession::throughput(double elapsed_s) const {
    if (!(elapsed_s > 0.0)) return 0.0;
    return (double)sent_bytes / elapsed_s;
}

double TransferSession::display_time(double elapsed_s) const {
    if (streaming()) return elapsed_s;
    if (sent_bytes == 0) return 0.0;
    double eta = (double)total_bytes * elapsed_s / (double)sent_bytes - elapsed_s;
    return eta > 0.0 ? eta : 0.0;
}

ProgressFrame TransferSession::frame(double time_s, double speed) const {
    ProgressFrame f;
    f.mode        = mode;
    f.sent_bytes  = sent_bytes;
    f.intervals   = interval_count;
    f.total_bytes = total_bytes;
    f.time_s      = time_s;
    f.speed       = speed;
    return f;
}
