#pragma once

// ============================================================
// hash.hpp -- xxHash3 wrappers for payload digests
// ============================================================

#include "platform.hpp"
#include <cstddef>
#include <cstdio>
#include <stdexcept>
#include <string>

// XXH_STATIC_LINKING_ONLY exposes the XXH3 state type
#define XXH_STATIC_LINKING_ONLY
#include "xxhash.h"

namespace hash {

// One-shot xxh3_64 of a memory buffer
inline u64 xxh3_64(const void* data, size_t len) {
    return (u64)XXH3_64bits(data, len);
}

// 16 lowercase hex digits, the canonical xxh3_64 display form
inline std::string to_hex(u64 h) {
    char buf[17];
    std::snprintf(buf, sizeof(buf), "%016llx", (unsigned long long)h);
    return buf;
}

// Streaming hasher for xxh3_64
class StreamHasher64 {
public:
    StreamHasher64() {
        state_ = XXH3_createState();
        if (!state_) throw std::runtime_error("XXH3_createState failed");
        reset();
    }

    ~StreamHasher64() {
        if (state_) XXH3_freeState(state_);
    }

    StreamHasher64(const StreamHasher64&) = delete;
    StreamHasher64& operator=(const StreamHasher64&) = delete;

    void reset() {
        XXH3_64bits_reset(state_);
    }

    void update(const void* data, size_t len) {
        XXH3_64bits_update(state_, data, len);
    }

    u64 digest() const {
        return (u64)XXH3_64bits_digest(state_);
    }

private:
    XXH3_state_t* state_;
};

} // namespace hash
