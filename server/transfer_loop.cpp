// ============================================================
// transfer_loop.cpp -- TransferLoop implementation
// ============================================================

#include "transfer_loop.hpp"
#include "../common/errors.hpp"
#include "../common/logger.hpp"
#include "../common/utils.hpp"
#include <algorithm>
#include <stdexcept>

TransferLoop::TransferLoop(TransferSession& session,
                           ByteSource& source,
                           ResponseFramer& framer,
                           ProgressRenderer& progress,
                           std::chrono::milliseconds refresh)
    : session_(session)
    , source_(source)
    , framer_(framer)
    , progress_(progress)
    , refresh_(refresh)
    , buf_(session.buffer_size)
{}

bool TransferLoop::pull(size_t& got) {
    got = 0;

    size_t want = session_.buffer_size;
    if (!session_.streaming()) {
        u64 left = session_.remaining();
        if (left == 0) return false;
        want = (size_t)std::min<u64>(want, left);
    }

    if (!source_.wait_readable(refresh_)) {
        return true;  // idle tick
    }

    switch (source_.read(buf_.data(), want, got)) {
        case ByteSource::ReadStatus::Data:
            return true;
        case ByteSource::ReadStatus::Again:
            got = 0;
            return true;
        case ByteSource::ReadStatus::Eof:
            break;
    }

    if (!session_.streaming()) {
        throw TransportError("Input ended after " + std::to_string(session_.sent_bytes) +
                             " of " + std::to_string(session_.total_bytes) + " bytes");
    }
    return false;
}

void TransferLoop::account(TransferSession::clock::time_point now) {
    double elapsed = utils::seconds_between(session_.start_time, now);
    double speed   = session_.throughput(elapsed);

    if (now - session_.last_progress_time > refresh_) {
        progress_.render(session_.frame(session_.display_time(elapsed), speed));
        session_.last_progress_time = now;
        ++session_.interval_count;
    }
}

void TransferLoop::finalize() {
    if (session_.streaming()) {
        framer_.send_trailer();
    }
    framer_.flush();

    auto now   = TransferSession::clock::now();
    elapsed_s_ = utils::seconds_between(session_.start_time, now);

    // final progressbar, always shows elapsed time
    progress_.render(session_.frame(elapsed_s_, session_.throughput(elapsed_s_)));
    progress_.finish();
}

void TransferLoop::run() {
    if (!session_.header_sent) {
        throw std::logic_error("TransferLoop::run before the response header");
    }

    session_.start_time = session_.last_progress_time = TransferSession::clock::now();
    progress_.render(session_.frame(0.0, 0.0));

    size_t got = 0;
    while (pull(got)) {
        if (got > 0) {
            framer_.send_payload(buf_.data(), got);
            session_.record_sent(buf_.data(), got);
        }
        account(TransferSession::clock::now());
    }

    finalize();
    LOG_DEBUG("Source exhausted after " + std::to_string(session_.write_cycles) +
              " write cycles");
}
