#pragma once

// ============================================================
// utils.hpp -- Utility functions
// ============================================================

#include "platform.hpp"
#include <string>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <limits>

namespace utils {

// Seconds elapsed between two steady_clock points
inline double seconds_between(std::chrono::steady_clock::time_point from,
                              std::chrono::steady_clock::time_point to) {
    return std::chrono::duration<double>(to - from).count();
}

// Group decimal digits in threes: 1234567 -> "1,234,567"
inline std::string commify(u64 n) {
    std::string digits = std::to_string(n);
    std::string out;
    out.reserve(digits.size() + digits.size() / 3);
    for (size_t i = 0; i < digits.size(); ++i) {
        if (i != 0 && (digits.size() - i) % 3 == 0) out += ',';
        out += digits[i];
    }
    return out;
}

// Scale a byte count (or rate) to B/K/M/G with one decimal.
// A trailing ".0" is dropped and plain bytes are shown as an integer:
// 512 -> "512B", 1536 -> "1.5K", 1048576 -> "1M".
inline std::string human_bytes(double bytes) {
    struct Unit { double value; char sym; };
    static const Unit units[] = {
        { 1073741824.0, 'G' },
        {    1048576.0, 'M' },
        {       1024.0, 'K' },
        {          1.0, 'B' },
    };

    if (!(bytes > 0.0)) bytes = 0.0;

    const Unit* unit = &units[3];
    for (const auto& u : units) {
        if (bytes >= u.value) { unit = &u; break; }
    }

    if (unit->sym == 'B') {
        char buf[64];
        std::snprintf(buf, sizeof(buf), "%.1f", bytes);
        // integer part of the rounded value
        std::string s = buf;
        return s.substr(0, s.find('.')) + unit->sym;
    }

    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.1f", bytes / unit->value);
    std::string s = buf;
    if (s.size() > 2 && s.compare(s.size() - 2, 2, ".0") == 0) {
        s.resize(s.size() - 2);
    }
    return s + unit->sym;
}

// Format a duration as "1d 2h 3m 4s", omitting zero components except
// seconds. Past 99 days only the day count is shown: "123d+".
inline std::string human_time(double seconds) {
    if (!(seconds > 0.0)) seconds = 0.0;
    if (seconds > 1e15) seconds = 1e15;

    u64 total = (u64)seconds;
    u64 days  = total / 86400;
    u64 hours = (total / 3600) % 24;
    u64 mins  = (total / 60) % 60;
    u64 secs  = total % 60;

    if (days >= 100) {
        return std::to_string(days) + "d+";
    }

    std::string out;
    auto add = [&out](u64 v, char sym) {
        if (!out.empty()) out += ' ';
        out += std::to_string(v);
        out += sym;
    };
    if (days  > 0) add(days,  'd');
    if (hours > 0) add(hours, 'h');
    if (mins  > 0) add(mins,  'm');
    add(secs, 's');
    return out;
}

// Lowercase hex without leading zeros, as used in chunk-size lines
inline std::string to_hex(u64 v) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%llx", (unsigned long long)v);
    return buf;
}

// Parse a string made only of decimal digits. Returns false on empty
// input, any non-digit, or overflow of u64.
inline bool parse_decimal(const std::string& s, u64& out) {
    if (s.empty()) return false;
    u64 v = 0;
    for (char c : s) {
        if (c < '0' || c > '9') return false;
        u64 d = (u64)(c - '0');
        if (v > (std::numeric_limits<u64>::max() - d) / 10) return false;
        v = v * 10 + d;
    }
    out = v;
    return true;
}

// Validate port number (1-65535)
inline bool validate_port(u64 port) {
    return port >= 1 && port <= 65535;
}

// Last path component, ignoring trailing slashes: "/a/b/" -> "b"
inline std::string basename(const std::string& path) {
    std::string p = path;
    while (p.size() > 1 && p.back() == '/') p.pop_back();
    size_t slash = p.find_last_of('/');
    if (slash == std::string::npos || p.size() == 1) return p;
    return p.substr(slash + 1);
}

// Clamp value
template<typename T>
inline T clamp(T val, T lo, T hi) {
    return val < lo ? lo : (val > hi ? hi : val);
}

} // namespace utils
