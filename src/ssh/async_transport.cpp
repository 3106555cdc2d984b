#include "async_transport.hpp"
#include <core/log.hpp>
#include <platform/socket_util.hpp>
#include <libssh2.h>
#include <fmt/format.h>

AsyncTransport::AsyncTransport(net::io_context& ioc, int connect_timeout_secs,
                               const CancellationToken& cancel)
    : ioc_(ioc), timeout_secs_(connect_timeout_secs), cancel_(cancel),
      resolver_(ioc), socket_(ioc), watchdog_(ioc) {}

AsyncTransport::~AsyncTransport() {
    disconnect();
}

// ── Coroutine plumbing ───────────────────────────────────────

Result<void> AsyncTransport::run_step(const std::function<Result<void>()>& step) {
    Result<void> result = Result<void>::Err(ErrorKind::TRANSPORT, "Operation did not complete");
    deadline_ = std::chrono::steady_clock::now() + std::chrono::seconds(timeout_secs_);
    abort_reason_ = SessionError{};

    ioc_.restart();
    net::spawn(ioc_, [&](net::yield_context yield) {
        yield_ = &yield;
        arm_watchdog();
        result = step();
        watchdog_.cancel();
        yield_ = nullptr;
    });
    ioc_.run();
    return result;
}

void AsyncTransport::arm_watchdog() {
    watchdog_.expires_after(std::chrono::milliseconds(100));
    watchdog_.async_wait([this](const boost::system::error_code& ec) {
        if (ec) return;  // cancelled: the step finished

        if (cancel_.cancelled()) {
            abort_reason_ = SessionError{ErrorKind::CANCELLED, AuthReason::NONE, "Cancelled"};
        } else if (std::chrono::steady_clock::now() >= deadline_) {
            abort_reason_ = SessionError{ErrorKind::TRANSPORT, AuthReason::NONE,
                                         fmt::format("Timed out after {}s", timeout_secs_)};
        } else {
            arm_watchdog();
            return;
        }
        boost::system::error_code ignored;
        resolver_.cancel();
        socket_.cancel(ignored);
    });
}

Result<void> AsyncTransport::wait_socket(int directions) {
    if (abort_reason_.kind != ErrorKind::NONE) return Result<void>::Err(abort_reason_);

    if (!yield_) {
        // Outside a coroutine (teardown): short blocking wait
        short events = (directions & LIBSSH2_SESSION_BLOCK_OUTBOUND) ? POLLOUT : POLLIN;
        platform::poll_socket(socket_.native_handle(), events, 50);
        if (std::chrono::steady_clock::now() >= deadline_)
            return Result<void>::Err(ErrorKind::TRANSPORT, "Timed out");
        return Result<void>::Ok();
    }

    auto wait_type = (directions & LIBSSH2_SESSION_BLOCK_OUTBOUND)
                         ? net::ip::tcp::socket::wait_write
                         : net::ip::tcp::socket::wait_read;
    boost::system::error_code ec;
    socket_.async_wait(wait_type, (*yield_)[ec]);

    if (abort_reason_.kind != ErrorKind::NONE) return Result<void>::Err(abort_reason_);
    if (ec && ec != net::error::operation_aborted) {
        return Result<void>::Err(ErrorKind::TRANSPORT, "Socket wait failed: " + ec.message());
    }
    return Result<void>::Ok();
}

// ── Transport ────────────────────────────────────────────────

Result<void> AsyncTransport::do_connect(const ConnectTarget& target) {
    boost::system::error_code ec;
    auto results = resolver_.async_resolve(target.host, std::to_string(target.port),
                                           (*yield_)[ec]);
    if (abort_reason_.kind != ErrorKind::NONE) return Result<void>::Err(abort_reason_);
    if (ec) {
        return Result<void>::Err(ErrorKind::TRANSPORT,
                                 fmt::format("Failed to resolve host {}: {}", target.host, ec.message()));
    }

    net::async_connect(socket_, results, (*yield_)[ec]);
    if (abort_reason_.kind != ErrorKind::NONE) {
        if (abort_reason_.kind == ErrorKind::TRANSPORT) {
            return Result<void>::Err(ErrorKind::TRANSPORT,
                                     fmt::format("Connection timed out: {}:{}", target.host, target.port));
        }
        return Result<void>::Err(abort_reason_);
    }
    if (ec) {
        return Result<void>::Err(ErrorKind::TRANSPORT,
                                 fmt::format("Failed to connect to {}:{}: {}",
                                             target.host, target.port, ec.message()));
    }

    socket_.non_blocking(true, ec);
    platform::enable_keepalive(socket_.native_handle());
    rzterm_log(fmt::format("tcp connected to {}:{} (async)", target.host, target.port));

    session_ = std::make_unique<Libssh2Session>(
        [this](int directions) { return wait_socket(directions); });
    return session_->handshake(socket_.native_handle());
}

Result<void> AsyncTransport::connect(const ConnectTarget& target) {
    auto r = run_step([&] { return do_connect(target); });
    if (r.is_err()) disconnect();
    return r;
}

Result<void> AsyncTransport::authenticate(const ConnectTarget& target) {
    if (!session_) return Result<void>::Err(ErrorKind::TRANSPORT, "Not connected");
    auto r = run_step([&] {
        return session_->authenticate(target, [](const std::string& msg) { rzterm_log(msg); });
    });
    if (r.is_err()) {
        rzterm_log("authentication failed: " + describe(r.error));
        disconnect();
    }
    return r;
}

Result<LIBSSH2_CHANNEL*> AsyncTransport::new_channel() {
    if (!session_) return Result<LIBSSH2_CHANNEL*>::Err(ErrorKind::TRANSPORT, "Not connected");
    if (channel_ && !channel_->closed()) {
        return Result<LIBSSH2_CHANNEL*>::Err(ErrorKind::CHANNEL, "A channel is already open");
    }
    return session_->open_channel();
}

Result<Channel*> AsyncTransport::open_shell(const std::string& term, platform::TermSize size) {
    auto r = run_step([&]() -> Result<void> {
        auto ch = new_channel();
        if (ch.is_err()) return Result<void>::Err(ch.error);
        channel_ = std::make_unique<Libssh2Channel>(ch.value, session_->raw(),
                                                    socket_.native_handle());
        auto pty = session_->request_pty(ch.value, term, size);
        if (pty.is_err()) return pty;
        return session_->start_shell(ch.value);
    });
    if (r.is_err()) return Result<Channel*>::Err(r.error);

    rzterm_log(fmt::format("shell opened ({} {}x{})", term, size.cols, size.rows));
    return Result<Channel*>::Ok(channel_.get());
}

Result<Channel*> AsyncTransport::exec(const std::string& command) {
    auto r = run_step([&]() -> Result<void> {
        auto ch = new_channel();
        if (ch.is_err()) return Result<void>::Err(ch.error);
        channel_ = std::make_unique<Libssh2Channel>(ch.value, session_->raw(),
                                                    socket_.native_handle());
        return session_->start_exec(ch.value, command);
    });
    if (r.is_err()) return Result<Channel*>::Err(r.error);
    return Result<Channel*>::Ok(channel_.get());
}

void AsyncTransport::disconnect() {
    if (channel_) {
        auto r = channel_->close();
        if (r.is_err()) rzterm_log("channel close: " + r.error.message);
        channel_.reset();
    }
    if (session_) {
        deadline_ = std::chrono::steady_clock::now() + std::chrono::milliseconds(500);
        abort_reason_ = SessionError{};
        session_->disconnect();
        session_.reset();
    }
    boost::system::error_code ignored;
    if (socket_.is_open()) socket_.close(ignored);
}
