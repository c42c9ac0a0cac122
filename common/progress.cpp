// ============================================================
// progress.cpp -- Progress bar implementation
// ============================================================

#include "progress.hpp"
#include "utils.hpp"
#include <cstdio>

ProgressRenderer::ProgressRenderer(std::ostream& out, int term_width)
    : ProgressRenderer(out, term_width, term_width - RESERVED_COLUMNS)
{}

ProgressRenderer::ProgressRenderer(std::ostream& out, int term_width, int bar_width)
    : out_(out)
    , term_width_(term_width)
    , bar_width_(bar_width < MIN_BAR_WIDTH ? MIN_BAR_WIDTH : bar_width)
{}

int ProgressRenderer::percent(u64 sent, i64 total) {
    if (total <= 0) return 0;
    u64 pct = sent * 100 / (u64)total;
    return pct > 100 ? 100 : (int)pct;
}

std::string ProgressRenderer::build_fixed_bar(u64 sent, i64 total) const {
    u64 fill = 1;
    if (total > 0) {
        fill = sent * (u64)bar_width_ / (u64)total;
        fill = utils::clamp<u64>(fill, 1, (u64)bar_width_);
    }

    std::string bar((size_t)(fill - 1), '=');
    bar += '>';
    bar.append((size_t)bar_width_ - (size_t)fill, ' ');
    return bar;
}

std::string ProgressRenderer::build_streaming_bar(u64 intervals) const {
    // s runs 1 .. (bar-2)*2 and back to 1, so the marker sweeps right then left
    u64 span = (u64)(bar_width_ - 2) * 2;
    u64 s    = (intervals % span) + 1;
    u64 bar  = (u64)bar_width_;

    u64 pre, post;
    if (s <= bar - 2) {
        pre  = s - 1;
        post = bar - s - 2;
    } else {
        pre  = bar * 2 - s - 4;
        post = s - bar + 1;
    }

    std::string out((size_t)pre, ' ');
    out += "<=>";
    out.append((size_t)post, ' ');
    return out;
}

std::string ProgressRenderer::build_line(const ProgressFrame& frame) const {
    char buf[64];
    std::string line;

    if (frame.mode == TransferMode::FixedLength) {
        std::snprintf(buf, sizeof(buf), " %3d%% [",
                      percent(frame.sent_bytes, frame.total_bytes));
        line = buf;
        line += build_fixed_bar(frame.sent_bytes, frame.total_bytes);
        line += ']';
    } else {
        line = "  --  [";
        line += build_streaming_bar(frame.intervals);
        line += ']';
    }

    std::string count = utils::commify(frame.sent_bytes);
    std::snprintf(buf, sizeof(buf), " %15s", count.c_str());
    line += buf;
    line += " (" + utils::human_time(frame.time_s) + ") ";
    line += utils::human_bytes(frame.speed) + "/s";

    if ((int)line.size() < term_width_) {
        line.append((size_t)(term_width_ - (int)line.size()), ' ');
    }
    return line;
}

void ProgressRenderer::render(const ProgressFrame& frame) {
    out_ << build_line(frame) << '\r';
    out_.flush();
}

void ProgressRenderer::finish() {
    out_ << '\n';
    out_.flush();
}
