#pragma once

#include "channel.hpp"

// libssh2 forward declarations
typedef struct _LIBSSH2_SESSION LIBSSH2_SESSION;
typedef struct _LIBSSH2_CHANNEL LIBSSH2_CHANNEL;

// Channel over a non-blocking libssh2 channel. Owns the LIBSSH2_CHANNEL and
// frees it on close; the session and socket belong to the transport.
class Libssh2Channel : public Channel {
public:
    Libssh2Channel(LIBSSH2_CHANNEL* ch, LIBSSH2_SESSION* session, int sock);
    ~Libssh2Channel() override;

    Libssh2Channel(const Libssh2Channel&) = delete;
    Libssh2Channel& operator=(const Libssh2Channel&) = delete;

    int poll_fd() const override { return sock_; }
    int exit_status() const override { return exit_status_; }

protected:
    platform::IoResult do_read(char* buf, std::size_t len) override;
    platform::IoResult do_read_stderr(char* buf, std::size_t len) override;
    platform::IoResult do_write(const char* data, std::size_t len) override;
    Result<void> do_send_eof() override;
    Result<void> do_close() override;

private:
    LIBSSH2_CHANNEL* ch_;
    LIBSSH2_SESSION* session_;
    int sock_;
    int exit_status_ = -1;

    platform::IoResult translate_read(long n);
};
