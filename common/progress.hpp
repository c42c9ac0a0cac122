#pragma once

// ============================================================
// progress.hpp -- Single-line terminal progress bar
//
// Fixed-length transfers get a percentage and a filling bar:
//    42% [============>                 ]       1,234,567 (3s) 1.2M/s
// Streams of unknown size get a bouncing "<=>" marker instead:
//   --  [          <=>                 ]       1,234,567 (9s) 640K/s
//
// The line is padded to the terminal width and terminated with '\r'
// so the next render overwrites it in place.
// ============================================================

#include "platform.hpp"
#include <string>
#include <ostream>

enum class TransferMode {
    FixedLength,
    Streaming,
};

// Everything one progress line shows
struct ProgressFrame {
    TransferMode mode{TransferMode::FixedLength};
    u64    sent_bytes{0};
    u64    intervals{0};     // refresh counter, drives the streaming marker
    i64    total_bytes{-1};  // -1 when unknown
    double time_s{0.0};      // ETA (fixed-length) or elapsed (streaming/final)
    double speed{0.0};       // bytes per second
};

class ProgressRenderer {
public:
    // Room left for the bar after the percentage and the stats block
    static constexpr int RESERVED_COLUMNS = 50;
    static constexpr int MIN_BAR_WIDTH    = 10;

    ProgressRenderer(std::ostream& out, int term_width);
    ProgressRenderer(std::ostream& out, int term_width, int bar_width);

    int term_width() const { return term_width_; }
    int bar_width() const { return bar_width_; }

    // Pure formatting: the padded line without the trailing '\r'
    std::string build_line(const ProgressFrame& frame) const;

    // Draw one frame in place
    void render(const ProgressFrame& frame);

    // Move past the progress line once the transfer is over
    void finish();

    // Integer percentage, 0 when the total is unknown or zero
    static int percent(u64 sent, i64 total);

private:
    std::ostream& out_;
    int           term_width_;
    int           bar_width_;

    std::string build_fixed_bar(u64 sent, i64 total) const;
    std::string build_streaming_bar(u64 intervals) const;
};
