#include "async_loop.hpp"
#include <core/constants.hpp>
#include <platform/nonblocking_io.hpp>
#include <boost/asio/spawn.hpp>
#include <chrono>
#include <memory>
#include <cstring>
#include <unistd.h>
#include <fmt/format.h>

using platform::IoStatus;
using boost::system::error_code;

namespace {

constexpr auto TICK = std::chrono::milliseconds(ASYNC_TICK_MS);

struct LoopState {
    net::io_context& ioc;
    LoopContext& ctx;
    net::posix::stream_descriptor input;
    net::posix::stream_descriptor output;
    net::posix::stream_descriptor channel;
    net::steady_timer tick;
    net::steady_timer input_idle;
    net::steady_timer helper_idle;
    net::steady_timer writer_wake;
    net::steady_timer channel_wake;
    bool done = false;
    LoopOutcome outcome;

    // Set while the terminal reader is inside the router, which may prompt
    // for an upload path on this coroutine.
    net::yield_context* reader_yield = nullptr;
    std::shared_ptr<net::posix::stream_descriptor> prompt_watch;

    LoopState(net::io_context& io, LoopContext& c, int in_fd, int out_fd, int ch_fd)
        : ioc(io), ctx(c), input(io, in_fd), output(ioc, out_fd), channel(ioc, ch_fd),
          tick(ioc), input_idle(ioc), helper_idle(ioc), writer_wake(ioc), channel_wake(ioc) {}

    void finish(LoopExit exit, const SessionError& err = SessionError{}) {
        if (done) return;
        done = true;
        outcome.exit = exit;
        outcome.error = err;
        rzterm_log(fmt::format("async loop finishing: {}", loop_exit_name(exit)));

        error_code ignored;
        input.cancel(ignored);
        channel.cancel(ignored);
        if (prompt_watch) prompt_watch->cancel(ignored);
        tick.cancel();
        input_idle.cancel();
        helper_idle.cancel();
        channel_wake.cancel();
        // The terminal writer drains what is queued, then exits
        writer_wake.cancel();
    }

    void fail(const std::string& msg) {
        finish(LoopExit::IO_ERROR, SessionError{ErrorKind::IO, AuthReason::NONE, msg});
    }

    void fail(const SessionError& err) { finish(LoopExit::IO_ERROR, err); }

    void wake_writers() {
        writer_wake.cancel();
        channel_wake.cancel();
    }

    void drain_stderr() {
        char buf[CHANNEL_READ_BUF_SIZE];
        for (;;) {
            auto e = ctx.channel.read_stderr(buf, sizeof(buf));
            if (e.status != IoStatus::DATA) break;
            ctx.terminal.write(buf, e.n);
        }
    }

    // Read the channel until it would block. Also called from the tick:
    // libssh2 may buffer data while writing, without the socket turning readable.
    void drain_channel() {
        char buf[CHANNEL_READ_BUF_SIZE];
        while (!done) {
            auto r = ctx.channel.read(buf, sizeof(buf));
            if (r.status == IoStatus::WOULD_BLOCK) break;
            if (r.status == IoStatus::END_OF_FILE) {
                drain_stderr();
                finish(LoopExit::REMOTE_EOF);
                return;
            }
            if (r.status == IoStatus::ERROR) {
                fail(fmt::format("Channel read failed: {}", std::strerror(r.err)));
                return;
            }
            auto routed = ctx.router.on_remote_output(buf, r.n);
            if (routed.is_err()) {
                fail(routed.error);
                return;
            }
        }
        if (done) return;
        auto e = ctx.channel.read_stderr(buf, sizeof(buf));
        if (e.status == IoStatus::DATA) ctx.terminal.write(buf, e.n);
        wake_writers();
    }

    void service() {
        auto helper = ctx.router.service_helper();
        if (helper.is_err()) {
            fail(helper.error);
            return;
        }
        auto pumped = ctx.router.pump_to_channel();
        if (pumped.is_err()) fail(pumped.error);
    }
};

void park(net::steady_timer& timer, net::yield_context& yield) {
    error_code ec;
    timer.expires_after(TICK);
    timer.async_wait(yield[ec]);
}

void sleep_until_woken(net::steady_timer& timer, net::yield_context& yield) {
    error_code ec;
    timer.expires_at(net::steady_timer::time_point::max());
    timer.async_wait(yield[ec]);
}

// Upload prompt and picker waits. On the terminal reader's coroutine they
// suspend only that coroutine; the channel, the writers and the tick go on.
InputWait wait_for_prompt(LoopState& st, int fd, int timeout_ms) {
    if (st.done) return InputWait::STOPPED;
    if (!st.reader_yield) {
        return platform::wait_readable(fd, timeout_ms) ? InputWait::READY : InputWait::TIMEOUT;
    }

    int dup_fd = ::dup(fd);
    if (dup_fd < 0) {
        rzterm_log(fmt::format("Cannot watch prompt input: {}", std::strerror(errno)));
        return InputWait::STOPPED;
    }
    auto watched = std::make_shared<net::posix::stream_descriptor>(st.ioc, dup_fd);
    auto timed_out = std::make_shared<bool>(false);
    st.prompt_watch = watched;

    net::steady_timer timer(st.ioc);
    timer.expires_after(std::chrono::milliseconds(timeout_ms));
    timer.async_wait([watched, timed_out](const error_code& e) {
        if (e) return;
        *timed_out = true;
        error_code ignored;
        watched->cancel(ignored);
    });

    error_code ec;
    watched->async_wait(net::posix::stream_descriptor::wait_read, (*st.reader_yield)[ec]);
    timer.cancel();
    st.prompt_watch.reset();

    if (st.done) return InputWait::STOPPED;
    if (!ec) return InputWait::READY;
    if (*timed_out) return InputWait::TIMEOUT;
    rzterm_log("prompt wait failed: " + ec.message());
    return InputWait::STOPPED;
}

// ── Coroutines ───────────────────────────────────────────────

void terminal_reader(LoopState& st, net::yield_context yield) {
    char buf[LOCAL_READ_BUF_SIZE];
    while (!st.done) {
        if (!st.ctx.terminal.bridge_owns()) {
            park(st.input_idle, yield);
            continue;
        }
        error_code ec;
        st.input.async_wait(net::posix::stream_descriptor::wait_read, yield[ec]);
        if (st.done) break;
        if (ec) {
            if (ec == net::error::operation_aborted) continue;
            st.fail("Terminal wait failed: " + ec.message());
            break;
        }
        if (!st.ctx.terminal.bridge_owns()) continue;

        auto r = st.ctx.terminal.read(buf, sizeof(buf));
        if (r.is_err()) {
            st.fail(r.error);
            break;
        }
        const auto& io = r.value;
        if (io.status == IoStatus::END_OF_FILE) {
            st.finish(LoopExit::LOCAL_EOF);
            break;
        }
        if (io.status == IoStatus::ERROR) {
            st.fail(fmt::format("Terminal read failed: {}", std::strerror(io.err)));
            break;
        }
        if (io.status != IoStatus::DATA) continue;

        st.reader_yield = &yield;
        auto routed = st.ctx.router.on_local_input(buf, io.n);
        st.reader_yield = nullptr;
        if (routed.is_err()) {
            st.fail(routed.error);
            break;
        }
        st.wake_writers();
    }
}

void channel_reader(LoopState& st, net::yield_context yield) {
    while (!st.done) {
        st.drain_channel();
        if (st.done) break;

        error_code ec;
        st.channel.async_wait(net::posix::stream_descriptor::wait_read, yield[ec]);
        if (ec && ec != net::error::operation_aborted && !st.done) {
            st.fail("Channel wait failed: " + ec.message());
        }
    }
}

void channel_writer(LoopState& st, net::yield_context yield) {
    while (!st.done) {
        auto pumped = st.ctx.router.pump_to_channel();
        if (pumped.is_err()) {
            st.fail(pumped.error);
            break;
        }
        error_code ec;
        if (st.ctx.router.has_pending_channel_writes()) {
            st.channel.async_wait(net::posix::stream_descriptor::wait_write, yield[ec]);
        } else {
            sleep_until_woken(st.channel_wake, yield);
        }
    }
}

void terminal_writer(LoopState& st, net::yield_context yield) {
    for (;;) {
        std::string out = st.ctx.terminal.take_pending();
        if (out.empty()) {
            if (st.done) break;
            sleep_until_woken(st.writer_wake, yield);
            continue;
        }
        error_code ec;
        st.ctx.terminal.set_write_in_flight(true);
        net::async_write(st.output, net::buffer(out), yield[ec]);
        st.ctx.terminal.set_write_in_flight(false);
        if (ec) {
            if (!st.done) st.fail("Terminal write failed: " + ec.message());
            break;
        }
    }
}

void helper_pump(LoopState& st, net::io_context& ioc, net::yield_context yield) {
    while (!st.done) {
        int fd = st.ctx.router.helper_stdout_fd();
        if (fd < 0) {
            park(st.helper_idle, yield);
            continue;
        }
        int dup_fd = ::dup(fd);
        if (dup_fd < 0) {
            st.fail(fmt::format("Cannot watch helper output: {}", std::strerror(errno)));
            break;
        }
        auto helper_out = std::make_shared<net::posix::stream_descriptor>(ioc, dup_fd);
        int transfer = st.ctx.router.transfer_count();

        while (!st.done && st.ctx.router.transfer_active() &&
               st.ctx.router.transfer_count() == transfer) {
            // Helper exit without output is noticed by the tick timeout
            error_code ec;
            st.helper_idle.expires_after(TICK);
            st.helper_idle.async_wait([helper_out, &st](const error_code& e) {
                if (!e || st.done) {
                    error_code ignored;
                    helper_out->cancel(ignored);
                }
            });
            helper_out->async_wait(net::posix::stream_descriptor::wait_read, yield[ec]);
            st.helper_idle.cancel();
            if (st.done) break;
            st.service();
            st.wake_writers();
        }
    }
}

void ticker(LoopState& st, net::yield_context yield) {
    while (!st.done) {
        error_code ec;
        st.tick.expires_after(TICK);
        st.tick.async_wait(yield[ec]);
        if (st.done) break;

        if (st.ctx.cancel.cancelled()) {
            st.finish(LoopExit::CANCELLED);
            break;
        }
        st.service();
        if (st.done) break;
        st.drain_channel();
        if (st.done) break;
        st.ctx.router.pump_to_helper();
        st.wake_writers();
    }
}

} // namespace

LoopOutcome AsyncLoop::run(LoopContext& ctx) {
    platform::NonBlockingScope in_scope(ctx.terminal.input_fd());
    platform::NonBlockingScope out_scope(ctx.terminal.output_fd());

    int in_fd = ::dup(ctx.terminal.input_fd());
    int out_fd = ::dup(ctx.terminal.output_fd());
    int ch_fd = ::dup(ctx.channel.poll_fd());
    if (in_fd < 0 || out_fd < 0 || ch_fd < 0) {
        int err = errno;
        if (in_fd >= 0) ::close(in_fd);
        if (out_fd >= 0) ::close(out_fd);
        if (ch_fd >= 0) ::close(ch_fd);
        LoopOutcome out;
        out.exit = LoopExit::IO_ERROR;
        out.error = SessionError{ErrorKind::IO, AuthReason::NONE,
                                 fmt::format("Cannot duplicate descriptors: {}", std::strerror(err))};
        return out;
    }

    LoopState st(ioc_, ctx, in_fd, out_fd, ch_fd);
    ctx.terminal.set_on_pending([&st] { st.writer_wake.cancel(); });
    HelperLauncher& launcher = ctx.router.launcher();
    launcher.set_input_waiter([&st](int fd, int timeout_ms) {
        return wait_for_prompt(st, fd, timeout_ms);
    });

    ioc_.restart();
    net::spawn(ioc_, [&st](net::yield_context yield) { terminal_reader(st, yield); });
    net::spawn(ioc_, [&st](net::yield_context yield) { channel_reader(st, yield); });
    net::spawn(ioc_, [&st](net::yield_context yield) { channel_writer(st, yield); });
    net::spawn(ioc_, [&st](net::yield_context yield) { terminal_writer(st, yield); });
    net::spawn(ioc_, [this, &st](net::yield_context yield) { helper_pump(st, ioc_, yield); });
    net::spawn(ioc_, [&st](net::yield_context yield) { ticker(st, yield); });
    ioc_.run();

    ctx.terminal.set_on_pending(nullptr);
    launcher.set_input_waiter(nullptr);

    // Anything queued after the writer exited
    auto flushed = ctx.terminal.flush(LOCAL_WRITE_TIMEOUT_MS);
    if (flushed.is_err() && st.outcome.exit != LoopExit::IO_ERROR) {
        st.outcome.exit = LoopExit::IO_ERROR;
        st.outcome.error = flushed.error;
    }
    return st.outcome;
}
