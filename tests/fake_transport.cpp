#include "fake_transport.hpp"
#include <platform/nonblocking_io.hpp>
#include <sys/socket.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <algorithm>

using platform::IoResult;
using platform::IoStatus;

// ── FakeChannel ──────────────────────────────────────────────

FakeChannel::FakeChannel(int fd) : fd_(fd) {
    platform::set_nonblocking(fd_);
}

FakeChannel::~FakeChannel() {
    auto r = close();
    (void)r;
}

IoResult FakeChannel::do_read(char* buf, std::size_t len) {
    if (stdout_eof_) return IoResult{IoStatus::END_OF_FILE, 0, 0};
    auto r = platform::read_nonblocking(fd_, buf, len);
    if (r.status == IoStatus::END_OF_FILE) stdout_eof_ = true;
    return r;
}

IoResult FakeChannel::do_read_stderr(char* buf, std::size_t len) {
    if (!stderr_.empty()) {
        std::size_t n = std::min(len, stderr_.size());
        std::memcpy(buf, stderr_.data(), n);
        stderr_.erase(0, n);
        return IoResult{IoStatus::DATA, n, 0};
    }
    if (stdout_eof_) return IoResult{IoStatus::END_OF_FILE, 0, 0};
    return IoResult{IoStatus::WOULD_BLOCK, 0, 0};
}

IoResult FakeChannel::do_write(const char* data, std::size_t len) {
    return platform::write_some(fd_, data, len);
}

Result<void> FakeChannel::do_send_eof() {
    if (::shutdown(fd_, SHUT_WR) != 0) {
        return Result<void>::Err(ErrorKind::CHANNEL, std::strerror(errno));
    }
    return Result<void>::Ok();
}

Result<void> FakeChannel::do_close() {
    if (fd_ >= 0) ::close(fd_);
    fd_ = -1;
    return Result<void>::Ok();
}

// ── FakeTransport ────────────────────────────────────────────

FakeTransport::FakeTransport(FakeScript script, TransportBackend backend)
    : script_(std::move(script)), backend_(backend) {}

FakeTransport::~FakeTransport() {
    disconnect();
    channel_.reset();
    if (remote_fd_ >= 0) ::close(remote_fd_);
}

Result<void> FakeTransport::connect(const ConnectTarget&) {
    connect_calls_++;
    if (script_.connect_error.kind != ErrorKind::NONE) return Result<void>::Err(script_.connect_error);
    return Result<void>::Ok();
}

Result<void> FakeTransport::authenticate(const ConnectTarget&) {
    if (script_.auth_error.kind != ErrorKind::NONE) return Result<void>::Err(script_.auth_error);
    return Result<void>::Ok();
}

Result<int> FakeTransport::make_pair() {
    int fds[2];
    if (::socketpair(AF_UNIX, SOCK_STREAM, 0, fds) != 0) {
        return Result<int>::Err(ErrorKind::CHANNEL, std::strerror(errno));
    }
    channel_ = std::make_unique<FakeChannel>(fds[0]);
    if (remote_fd_ >= 0) ::close(remote_fd_);
    remote_fd_ = fds[1];
    return Result<int>::Ok(remote_fd_);
}

Result<Channel*> FakeTransport::open_shell(const std::string& term, platform::TermSize) {
    last_term_ = term;
    if (script_.shell_error.kind != ErrorKind::NONE) {
        return Result<Channel*>::Err(script_.shell_error);
    }
    auto pair = make_pair();
    if (pair.is_err()) return Result<Channel*>::Err(pair.error);
    channel_->set_exit_status(script_.shell_status);
    if (script_.on_shell) script_.on_shell(pair.value);
    return Result<Channel*>::Ok(channel_.get());
}

Result<Channel*> FakeTransport::exec(const std::string& command) {
    last_command_ = command;
    auto pair = make_pair();
    if (pair.is_err()) return Result<Channel*>::Err(pair.error);

    auto w = platform::write_all(pair.value, script_.exec_stdout.data(),
                                 script_.exec_stdout.size(), 1000);
    if (w.is_err()) return Result<Channel*>::Err(w.error);
    ::shutdown(pair.value, SHUT_WR);

    channel_->set_stderr(script_.exec_stderr);
    channel_->set_exit_status(script_.exec_status);
    return Result<Channel*>::Ok(channel_.get());
}

void FakeTransport::disconnect() {
    disconnect_calls_++;
    if (channel_) {
        auto r = channel_->close();
        (void)r;
    }
}
