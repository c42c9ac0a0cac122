#pragma once

// ============================================================
// write_buffer.hpp -- Application-level write buffer for TcpSocket
//
// Coalesces the small pieces of a response (status line, headers,
// chunk-size lines, chunk terminators) with the payload so that a
// read/write cycle costs one send() instead of three or four.
//
// A threshold of 0 turns the buffer into a pass-through: every
// write() reaches the socket before it returns (the -u option).
//
// Usage:
//   {
//       TcpWriteBuffer wbuf(sock);
//       wbuf.write("0\r\n\r\n", 5);
//   } // destructor flushes automatically
//
// Thread safety: NOT thread-safe; use one buffer per connection.
// ============================================================

#include "socket.hpp"
#include "logger.hpp"
#include <string>
#include <vector>

class TcpWriteBuffer {
public:
    // Flush (and send) when the internal buffer reaches this size.
    static constexpr size_t DEFAULT_THRESHOLD = 64 * 1024;

    explicit TcpWriteBuffer(TcpSocket& sock,
                            size_t threshold = DEFAULT_THRESHOLD)
        : sock_(sock), threshold_(threshold)
    {
        if (threshold_ > 0) buf_.reserve(threshold_ + 4096);
    }

    // Destructors must not throw; a failure here is only logged because
    // the owner already flushed explicitly on the success path.
    ~TcpWriteBuffer() {
        try {
            flush();
        } catch (const std::exception& e) {
            LOG_DEBUG(std::string("TcpWriteBuffer: discarding unsent data: ") + e.what());
        }
    }

    // Non-copyable, non-movable (holds a reference to TcpSocket)
    TcpWriteBuffer(const TcpWriteBuffer&) = delete;
    TcpWriteBuffer& operator=(const TcpWriteBuffer&) = delete;

    // Enqueue bytes. Flushes automatically when the buffer fills up.
    void write(const void* data, size_t len) {
        if (len == 0) return;
        if (threshold_ == 0) {
            sock_.send_all(data, len);
            return;
        }
        buf_.insert(buf_.end(),
                    static_cast<const u8*>(data),
                    static_cast<const u8*>(data) + len);
        if (buf_.size() >= threshold_) flush();
    }

    void write(const std::string& s) { write(s.data(), s.size()); }

    // Send all buffered data to the socket
    void flush() {
        if (!buf_.empty()) {
            std::vector<u8> pending;
            pending.swap(buf_);
            sock_.send_all(pending.data(), pending.size());
            pending.clear();
            buf_.swap(pending);  // keep the capacity
        }
    }

private:
    TcpSocket&      sock_;
    size_t          threshold_;
    std::vector<u8> buf_;
};
