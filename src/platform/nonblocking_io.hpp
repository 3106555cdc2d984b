#pragma once

#include <cstddef>
#include <core/types.hpp>

namespace platform {

enum class IoStatus {
    DATA,          // n bytes transferred
    WOULD_BLOCK,   // nothing available right now (not an error)
    END_OF_FILE,
    ERROR,         // err holds errno
};

struct IoResult {
    IoStatus status;
    std::size_t n;
    int err;

    bool data() const { return status == IoStatus::DATA; }
};

// Puts fd into O_NONBLOCK for the lifetime of the scope and restores the
// original file status flags afterwards.
class NonBlockingScope {
public:
    explicit NonBlockingScope(int fd);
    ~NonBlockingScope();

    NonBlockingScope(const NonBlockingScope&) = delete;
    NonBlockingScope& operator=(const NonBlockingScope&) = delete;

    bool ok() const { return original_flags_ >= 0; }

private:
    int fd_;
    int original_flags_;
};

// Set fd non-blocking permanently. Returns false on failure.
bool set_nonblocking(int fd);

// One read attempt. EAGAIN and EINTR are reported as WOULD_BLOCK.
IoResult read_nonblocking(int fd, char* buf, std::size_t len);

// One write attempt. EAGAIN and EINTR are reported as WOULD_BLOCK.
IoResult write_some(int fd, const char* data, std::size_t len);

// Write everything, waiting for POLLOUT between partial writes.
Result<void> write_all(int fd, const char* data, std::size_t len, int timeout_ms);

// Wait until fd is readable. Returns true if readable (or hung up).
bool wait_readable(int fd, int timeout_ms);

} // namespace platform
