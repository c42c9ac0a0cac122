// ============================================================
// byte_source.cpp -- ByteSource implementation
// ============================================================

#include "byte_source.hpp"
#include "../common/errors.hpp"
#include <poll.h>
#include <sys/stat.h>

ByteSource::ByteSource(int fd, bool owned, i64 total_bytes)
    : fd_(fd), owned_(owned), total_bytes_(total_bytes)
{}

ByteSource ByteSource::open_file(const std::string& path) {
    int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        throw SetupError("Invalid file specified: " + path + " (" +
                         socket_error_str(errno) + ")");
    }

    struct stat st{};
    if (fstat(fd, &st) != 0) {
        int err = errno;
        ::close(fd);
        throw SetupError("Cannot stat " + path + ": " + socket_error_str(err));
    }
    if (S_ISDIR(st.st_mode)) {
        ::close(fd);
        throw SetupError("Invalid file specified: " + path + " (is a directory)");
    }
    if (!S_ISREG(st.st_mode)) {
        // character devices and the like have no meaningful size
        return ByteSource(fd, true, -1);
    }
    return ByteSource(fd, true, (i64)st.st_size);
}

ByteSource ByteSource::from_stream(int fd, bool owned) {
    return ByteSource(fd, owned, -1);
}

bool ByteSource::is_pipe(int fd) {
    struct stat st{};
    if (fstat(fd, &st) != 0) return false;
    return S_ISFIFO(st.st_mode);
}

ByteSource::~ByteSource() {
    close();
}

ByteSource::ByteSource(ByteSource&& o) noexcept
    : fd_(o.fd_), owned_(o.owned_), total_bytes_(o.total_bytes_)
{
    o.fd_ = -1;
    o.owned_ = false;
}

ByteSource& ByteSource::operator=(ByteSource&& o) noexcept {
    if (this != &o) {
        close();
        fd_          = o.fd_;
        owned_       = o.owned_;
        total_bytes_ = o.total_bytes_;
        o.fd_    = -1;
        o.owned_ = false;
    }
    return *this;
}

bool ByteSource::wait_readable(std::chrono::milliseconds timeout) {
    pollfd pfd{};
    pfd.fd     = fd_;
    pfd.events = POLLIN;

    int rc = ::poll(&pfd, 1, (int)timeout.count());
    if (rc < 0) {
        if (errno == EINTR) return false;
        throw TransportError("Error during poll: " + socket_error_str(errno));
    }
    // POLLHUP without POLLIN still means a read will report EOF
    return rc > 0;
}

ByteSource::ReadStatus ByteSource::read(void* buf, size_t len, size_t& got) {
    got = 0;
    for (;;) {
        ssize_t n = ::read(fd_, buf, len);
        if (n > 0) {
            got = (size_t)n;
            return ReadStatus::Data;
        }
        if (n == 0) return ReadStatus::Eof;
        if (errno == EINTR) continue;
        if (would_block(errno)) return ReadStatus::Again;
        throw TransportError("Error reading input: " + socket_error_str(errno));
    }
}

void ByteSource::close() {
    if (fd_ >= 0 && owned_) {
        ::close(fd_);
    }
    fd_ = -1;
    owned_ = false;
}
