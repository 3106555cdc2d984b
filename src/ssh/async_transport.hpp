#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <boost/asio.hpp>
#include <boost/asio/spawn.hpp>
#include <core/cancellation.hpp>
#include "transport.hpp"
#include "libssh2_session.hpp"
#include "libssh2_channel.hpp"

namespace net = boost::asio;

// libssh2 driven from a stackful coroutine on a caller-owned io_context.
//
// Threading model:
// - Each operation spawns one coroutine and runs the io_context on the
//   calling thread until it finishes; no extra threads.
// - On EAGAIN the coroutine yields on socket readiness (async_wait) instead
//   of blocking.
// - A 100ms watchdog timer cancels the pending wait when the deadline
//   passes or the token is cancelled.
class AsyncTransport : public Transport {
public:
    AsyncTransport(net::io_context& ioc, int connect_timeout_secs,
                   const CancellationToken& cancel);
    ~AsyncTransport() override;

    Result<void> connect(const ConnectTarget& target) override;
    Result<void> authenticate(const ConnectTarget& target) override;
    Result<Channel*> open_shell(const std::string& term, platform::TermSize size) override;
    Result<Channel*> exec(const std::string& command) override;
    void disconnect() override;

    TransportBackend backend() const override { return TransportBackend::ASYNC; }

    net::io_context& context() { return ioc_; }

private:
    net::io_context& ioc_;
    int timeout_secs_;
    const CancellationToken& cancel_;
    net::ip::tcp::resolver resolver_;
    net::ip::tcp::socket socket_;
    net::steady_timer watchdog_;
    std::chrono::steady_clock::time_point deadline_;
    SessionError abort_reason_;
    net::yield_context* yield_ = nullptr;   // set while a coroutine step runs

    std::unique_ptr<Libssh2Session> session_;
    std::unique_ptr<Libssh2Channel> channel_;

    // Spawn step as a coroutine and run the io_context until it returns.
    Result<void> run_step(const std::function<Result<void>()>& step);
    void arm_watchdog();
    Result<void> wait_socket(int directions);
    Result<void> do_connect(const ConnectTarget& target);
    Result<LIBSSH2_CHANNEL*> new_channel();
};
