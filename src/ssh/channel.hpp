#pragma once

#include <cstddef>
#include <string>
#include <core/types.hpp>
#include <platform/nonblocking_io.hpp>

// A bidirectional byte stream bound to one remote shell or command.
//
// Owned by the Transport that opened it. close() runs at most once; after
// it, every read and write is rejected with IoStatus::ERROR (EBADF) and the
// implementation is never touched again.
class Channel {
public:
    virtual ~Channel() = default;

    platform::IoResult read(char* buf, std::size_t len);
    platform::IoResult read_stderr(char* buf, std::size_t len);
    platform::IoResult write(const char* data, std::size_t len);

    // Signal end of input to the remote command.
    Result<void> send_eof();

    // Close the channel. Later calls return Ok without doing anything.
    Result<void> close();

    bool closed() const { return closed_; }
    int close_count() const { return close_count_; }

    // Descriptor to wait on for readiness (the transport socket).
    virtual int poll_fd() const = 0;

    // Remote exit status, or -1 if the remote never reported one.
    virtual int exit_status() const = 0;

protected:
    virtual platform::IoResult do_read(char* buf, std::size_t len) = 0;
    virtual platform::IoResult do_read_stderr(char* buf, std::size_t len) = 0;
    virtual platform::IoResult do_write(const char* data, std::size_t len) = 0;
    virtual Result<void> do_send_eof() = 0;
    virtual Result<void> do_close() = 0;

private:
    bool closed_ = false;
    int close_count_ = 0;
};
