#include "library_transport.hpp"
#include <core/log.hpp>
#include <platform/socket_util.hpp>
#include <libssh2.h>
#include <algorithm>
#include <fmt/format.h>

LibraryTransport::LibraryTransport(int connect_timeout_secs, const CancellationToken& cancel,
                                   TransportBackend backend)
    : timeout_secs_(connect_timeout_secs), cancel_(cancel), backend_(backend) {}

LibraryTransport::~LibraryTransport() {
    disconnect();
}

void LibraryTransport::reset_deadline() {
    deadline_ = std::chrono::steady_clock::now() + std::chrono::seconds(timeout_secs_);
}

Result<void> LibraryTransport::poll_wait(int directions) {
    if (cancel_.cancelled()) {
        return Result<void>::Err(ErrorKind::CANCELLED, "Cancelled");
    }
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline_ - std::chrono::steady_clock::now()).count();
    if (remaining <= 0) {
        return Result<void>::Err(ErrorKind::TRANSPORT,
                                 fmt::format("Timed out after {}s", timeout_secs_));
    }

    short events = 0;
    if (directions & LIBSSH2_SESSION_BLOCK_INBOUND) events |= POLLIN;
    if (directions & LIBSSH2_SESSION_BLOCK_OUTBOUND) events |= POLLOUT;
    // Short slices keep cancellation responsive
    platform::poll_socket(sock_, events, static_cast<int>(std::min<long long>(remaining, 100)));
    return Result<void>::Ok();
}

Result<void> LibraryTransport::connect(const ConnectTarget& target) {
    reset_deadline();
    auto sock = platform::connect_tcp(target.host, target.port, timeout_secs_ * 1000);
    if (sock.is_err()) return Result<void>::Err(sock.error);
    sock_ = sock.value;
    platform::enable_keepalive(sock_);
    rzterm_log(fmt::format("tcp connected to {}:{}", target.host, target.port));

    session_ = std::make_unique<Libssh2Session>(
        [this](int directions) { return poll_wait(directions); });
    auto hs = session_->handshake(sock_);
    if (hs.is_err()) {
        disconnect();
        return hs;
    }
    return Result<void>::Ok();
}

Result<void> LibraryTransport::authenticate(const ConnectTarget& target) {
    if (!session_) return Result<void>::Err(ErrorKind::TRANSPORT, "Not connected");
    auto r = session_->authenticate(target, [](const std::string& msg) { rzterm_log(msg); });
    if (r.is_err()) {
        rzterm_log("authentication failed: " + describe(r.error));
        disconnect();
    }
    return r;
}

Result<LIBSSH2_CHANNEL*> LibraryTransport::new_channel() {
    if (!session_) return Result<LIBSSH2_CHANNEL*>::Err(ErrorKind::TRANSPORT, "Not connected");
    if (channel_ && !channel_->closed()) {
        return Result<LIBSSH2_CHANNEL*>::Err(ErrorKind::CHANNEL, "A channel is already open");
    }
    reset_deadline();
    return session_->open_channel();
}

Result<Channel*> LibraryTransport::open_shell(const std::string& term, platform::TermSize size) {
    auto ch = new_channel();
    if (ch.is_err()) return Result<Channel*>::Err(ch.error);

    channel_ = std::make_unique<Libssh2Channel>(ch.value, session_->raw(), sock_);

    auto pty = session_->request_pty(ch.value, term, size);
    if (pty.is_err()) return Result<Channel*>::Err(pty.error);
    auto shell = session_->start_shell(ch.value);
    if (shell.is_err()) return Result<Channel*>::Err(shell.error);

    rzterm_log(fmt::format("shell opened ({} {}x{})", term, size.cols, size.rows));
    return Result<Channel*>::Ok(channel_.get());
}

Result<Channel*> LibraryTransport::exec(const std::string& command) {
    auto ch = new_channel();
    if (ch.is_err()) return Result<Channel*>::Err(ch.error);

    channel_ = std::make_unique<Libssh2Channel>(ch.value, session_->raw(), sock_);

    auto r = session_->start_exec(ch.value, command);
    if (r.is_err()) return Result<Channel*>::Err(r.error);
    return Result<Channel*>::Ok(channel_.get());
}

void LibraryTransport::disconnect() {
    if (channel_) {
        auto r = channel_->close();
        if (r.is_err()) rzterm_log("channel close: " + r.error.message);
        channel_.reset();
    }
    if (session_) {
        // Bounded wait for the goodbye
        deadline_ = std::chrono::steady_clock::now() + std::chrono::milliseconds(500);
        session_->disconnect();
        session_.reset();
    }
    if (sock_ >= 0) {
        platform::close_socket(sock_);
        sock_ = -1;
    }
}
