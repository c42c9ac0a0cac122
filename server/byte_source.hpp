#pragma once

// ============================================================
// byte_source.hpp -- Payload source for the transfer loop
//
// Either a regular file (size known up front) or an unbounded
// stream such as a pipe on standard input (size unknown, -1).
// Both are plain descriptors, so readiness is waited on the same
// way for both; a regular file simply always polls readable.
// ============================================================

#include "../common/platform.hpp"
#include <string>
#include <chrono>

class ByteSource {
public:
    enum class ReadStatus {
        Data,   // 'got' bytes were read
        Again,  // nothing available right now (non-blocking stream)
        Eof,    // source exhausted
    };

    // Open a regular file for reading. Throws SetupError if it does not
    // exist, is not readable, or is a directory.
    static ByteSource open_file(const std::string& path);

    // Wrap an existing stream descriptor of unknown length.
    // 'owned' descriptors are closed by the ByteSource.
    static ByteSource from_stream(int fd, bool owned);

    // True when fd is a pipe/FIFO (how streaming mode is detected on stdin)
    static bool is_pipe(int fd);

    ~ByteSource();

    ByteSource(const ByteSource&) = delete;
    ByteSource& operator=(const ByteSource&) = delete;

    ByteSource(ByteSource&& o) noexcept;
    ByteSource& operator=(ByteSource&& o) noexcept;

    // Wait up to 'timeout' for data (or EOF) to become readable.
    // Returns false on timeout. Throws TransportError.
    bool wait_readable(std::chrono::milliseconds timeout);

    // Read up to 'len' bytes. Throws TransportError.
    ReadStatus read(void* buf, size_t len, size_t& got);

    bool is_stream() const { return total_bytes_ < 0; }

    // Exact size for files, -1 for streams
    i64 total_bytes() const { return total_bytes_; }

    int native() const { return fd_; }

    void close();

private:
    ByteSource(int fd, bool owned, i64 total_bytes);

    int  fd_{-1};
    bool owned_{false};
    i64  total_bytes_{-1};
};
