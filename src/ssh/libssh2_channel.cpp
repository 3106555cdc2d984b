#include "libssh2_channel.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <platform/socket_util.hpp>
#include <libssh2.h>
#include <cerrno>
#include <chrono>
#include <fmt/format.h>

using platform::IoResult;
using platform::IoStatus;

Libssh2Channel::Libssh2Channel(LIBSSH2_CHANNEL* ch, LIBSSH2_SESSION* session, int sock)
    : ch_(ch), session_(session), sock_(sock) {}

Libssh2Channel::~Libssh2Channel() {
    auto r = close();
    if (r.is_err()) rzterm_log("channel close on destruction: " + r.error.message);
}

IoResult Libssh2Channel::translate_read(long n) {
    if (n > 0) return IoResult{IoStatus::DATA, static_cast<std::size_t>(n), 0};
    if (n == LIBSSH2_ERROR_EAGAIN) return IoResult{IoStatus::WOULD_BLOCK, 0, 0};
    if (n == 0) {
        return libssh2_channel_eof(ch_) ? IoResult{IoStatus::END_OF_FILE, 0, 0}
                                        : IoResult{IoStatus::WOULD_BLOCK, 0, 0};
    }
    rzterm_log(fmt::format("channel read error {}", n));
    return IoResult{IoStatus::ERROR, 0, EIO};
}

IoResult Libssh2Channel::do_read(char* buf, std::size_t len) {
    return translate_read(libssh2_channel_read(ch_, buf, len));
}

IoResult Libssh2Channel::do_read_stderr(char* buf, std::size_t len) {
    return translate_read(libssh2_channel_read_stderr(ch_, buf, len));
}

IoResult Libssh2Channel::do_write(const char* data, std::size_t len) {
    long n = libssh2_channel_write(ch_, data, len);
    if (n >= 0) return IoResult{IoStatus::DATA, static_cast<std::size_t>(n), 0};
    if (n == LIBSSH2_ERROR_EAGAIN) return IoResult{IoStatus::WOULD_BLOCK, 0, 0};
    rzterm_log(fmt::format("channel write error {}", n));
    return IoResult{IoStatus::ERROR, 0, EIO};
}

Result<void> Libssh2Channel::do_send_eof() {
    auto deadline = std::chrono::steady_clock::now() +
                    std::chrono::milliseconds(CHANNEL_CLOSE_TIMEOUT_MS);
    int rc;
    while ((rc = libssh2_channel_send_eof(ch_)) == LIBSSH2_ERROR_EAGAIN) {
        if (std::chrono::steady_clock::now() >= deadline) break;
        platform::poll_socket(sock_, POLLIN | POLLOUT, 10);
    }
    if (rc != 0) return Result<void>::Err(ErrorKind::CHANNEL, "Failed to send EOF");
    return Result<void>::Ok();
}

Result<void> Libssh2Channel::do_close() {
    if (!ch_) return Result<void>::Ok();

    auto deadline = std::chrono::steady_clock::now() +
                    std::chrono::milliseconds(CHANNEL_CLOSE_TIMEOUT_MS);
    int rc;
    while ((rc = libssh2_channel_close(ch_)) == LIBSSH2_ERROR_EAGAIN) {
        if (std::chrono::steady_clock::now() >= deadline) break;
        platform::poll_socket(sock_, POLLIN | POLLOUT, 10);
    }

    // Exit status arrives with the remote close
    if (rc == 0) {
        while (libssh2_channel_wait_closed(ch_) == LIBSSH2_ERROR_EAGAIN) {
            if (std::chrono::steady_clock::now() >= deadline) break;
            platform::poll_socket(sock_, POLLIN, 10);
        }
    }
    exit_status_ = libssh2_channel_get_exit_status(ch_);

    while (libssh2_channel_free(ch_) == LIBSSH2_ERROR_EAGAIN) {
        if (std::chrono::steady_clock::now() >= deadline) break;
        platform::poll_socket(sock_, POLLIN | POLLOUT, 10);
    }
    ch_ = nullptr;

    if (rc != 0) {
        return Result<void>::Err(ErrorKind::CHANNEL,
                                 fmt::format("Channel close failed ({})", rc));
    }
    return Result<void>::Ok();
}
