#include "nonblocking_io.hpp"
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>
#include <cerrno>
#include <chrono>
#include <cstring>

namespace platform {

// ── NonBlockingScope ─────────────────────────────────────────

NonBlockingScope::NonBlockingScope(int fd) : fd_(fd) {
    original_flags_ = fcntl(fd_, F_GETFL, 0);
    if (original_flags_ >= 0) {
        fcntl(fd_, F_SETFL, original_flags_ | O_NONBLOCK);
    }
}

NonBlockingScope::~NonBlockingScope() {
    if (original_flags_ >= 0) {
        fcntl(fd_, F_SETFL, original_flags_);
    }
}

bool set_nonblocking(int fd) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags < 0) return false;
    return fcntl(fd, F_SETFL, flags | O_NONBLOCK) == 0;
}

// ── Single attempts ──────────────────────────────────────────

IoResult read_nonblocking(int fd, char* buf, std::size_t len) {
    ssize_t n = ::read(fd, buf, len);
    if (n > 0) return IoResult{IoStatus::DATA, static_cast<std::size_t>(n), 0};
    if (n == 0) return IoResult{IoStatus::END_OF_FILE, 0, 0};
    if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)
        return IoResult{IoStatus::WOULD_BLOCK, 0, 0};
    // A pty master reports EIO once the slave side is gone
    if (errno == EIO) return IoResult{IoStatus::END_OF_FILE, 0, EIO};
    return IoResult{IoStatus::ERROR, 0, errno};
}

IoResult write_some(int fd, const char* data, std::size_t len) {
    ssize_t n = ::write(fd, data, len);
    if (n >= 0) return IoResult{IoStatus::DATA, static_cast<std::size_t>(n), 0};
    if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)
        return IoResult{IoStatus::WOULD_BLOCK, 0, 0};
    return IoResult{IoStatus::ERROR, 0, errno};
}

// ── Blocking helpers ─────────────────────────────────────────

Result<void> write_all(int fd, const char* data, std::size_t len, int timeout_ms) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    std::size_t sent = 0;
    while (sent < len) {
        IoResult w = write_some(fd, data + sent, len - sent);
        if (w.status == IoStatus::DATA) {
            sent += w.n;
            continue;
        }
        if (w.status == IoStatus::ERROR) {
            return Result<void>::Err(ErrorKind::IO,
                                     std::string("write failed: ") + std::strerror(w.err));
        }
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        if (remaining <= 0) {
            return Result<void>::Err(ErrorKind::IO, "write stalled");
        }
        struct pollfd pfd = {fd, POLLOUT, 0};
        poll(&pfd, 1, static_cast<int>(remaining));
    }
    return Result<void>::Ok();
}

bool wait_readable(int fd, int timeout_ms) {
    struct pollfd pfd = {fd, POLLIN, 0};
    int ret = poll(&pfd, 1, timeout_ms);
    return ret > 0 && (pfd.revents & (POLLIN | POLLHUP | POLLERR));
}

} // namespace platform
