#include "polling_loop.hpp"
#include <core/constants.hpp>
#include <platform/nonblocking_io.hpp>
#include <platform/platform.hpp>
#include <cstring>
#include <poll.h>
#include <fmt/format.h>

using platform::IoStatus;

// Bound the channel drain so local input is still read under a flood
static const int MAX_CHANNEL_READS = 16;

const char* loop_exit_name(LoopExit exit) {
    switch (exit) {
        case LoopExit::REMOTE_EOF: return "remote EOF";
        case LoopExit::LOCAL_EOF:  return "local EOF";
        case LoopExit::CANCELLED:  return "cancelled";
        case LoopExit::IO_ERROR:   return "I/O error";
    }
    return "unknown";
}

static LoopOutcome io_failure(const std::string& msg) {
    LoopOutcome out;
    out.exit = LoopExit::IO_ERROR;
    out.error = SessionError{ErrorKind::IO, AuthReason::NONE, msg};
    return out;
}

static LoopOutcome io_failure(const SessionError& err) {
    LoopOutcome out;
    out.exit = LoopExit::IO_ERROR;
    out.error = err;
    return out;
}

static LoopOutcome ended(LoopExit exit) {
    LoopOutcome out;
    out.exit = exit;
    return out;
}

// ── Waiting ──────────────────────────────────────────────────

static void wait_for_activity(LoopContext& ctx) {
    int interval = ctx.settings.poll_interval_ms;
    if (ctx.settings.wait_strategy == WaitStrategy::BUSY_POLL) {
        platform::sleep_ms(interval);
        return;
    }

    struct pollfd fds[3];
    nfds_t n = 0;
    if (ctx.terminal.bridge_owns()) {
        fds[n++] = {ctx.terminal.input_fd(), POLLIN, 0};
    }
    short channel_events = POLLIN;
    if (ctx.router.has_pending_channel_writes()) channel_events |= POLLOUT;
    fds[n++] = {ctx.channel.poll_fd(), channel_events, 0};
    if (ctx.router.helper_stdout_fd() >= 0) {
        fds[n++] = {ctx.router.helper_stdout_fd(), POLLIN, 0};
    }
    // EINTR (a cancelling signal) just ends the wait early
    poll(fds, n, interval);
}

// ── Loop ─────────────────────────────────────────────────────

LoopOutcome PollingLoop::run(LoopContext& ctx) {
    platform::NonBlockingScope nonblocking(ctx.terminal.input_fd());
    if (!nonblocking.ok()) {
        return io_failure(fmt::format("Cannot make terminal input non-blocking: {}",
                                      std::strerror(errno)));
    }

    char lbuf[LOCAL_READ_BUF_SIZE];
    char cbuf[CHANNEL_READ_BUF_SIZE];

    for (;;) {
        if (ctx.cancel.cancelled()) return ended(LoopExit::CANCELLED);

        bool progressed = false;
        bool remote_eof = false;

        // local -> channel
        if (ctx.terminal.bridge_owns()) {
            auto r = ctx.terminal.read(lbuf, sizeof(lbuf));
            if (r.is_err()) return io_failure(r.error);
            const auto& io = r.value;
            if (io.status == IoStatus::END_OF_FILE) return ended(LoopExit::LOCAL_EOF);
            if (io.status == IoStatus::ERROR) {
                return io_failure(fmt::format("Terminal read failed: {}", std::strerror(io.err)));
            }
            if (io.status == IoStatus::DATA) {
                progressed = true;
                auto routed = ctx.router.on_local_input(lbuf, io.n);
                if (routed.is_err()) return io_failure(routed.error);
            }
        }

        // channel -> terminal / helper
        for (int i = 0; i < MAX_CHANNEL_READS; i++) {
            auto r = ctx.channel.read(cbuf, sizeof(cbuf));
            if (r.status == IoStatus::WOULD_BLOCK) break;
            if (r.status == IoStatus::END_OF_FILE) {
                remote_eof = true;
                break;
            }
            if (r.status == IoStatus::ERROR) {
                return io_failure(fmt::format("Channel read failed: {}", std::strerror(r.err)));
            }
            progressed = true;
            auto routed = ctx.router.on_remote_output(cbuf, r.n);
            if (routed.is_err()) return io_failure(routed.error);
        }

        // After EOF drain what stderr still holds
        for (;;) {
            auto e = ctx.channel.read_stderr(cbuf, sizeof(cbuf));
            if (e.status != IoStatus::DATA) break;
            progressed = true;
            ctx.terminal.write(cbuf, e.n);
            if (!remote_eof) break;
        }

        auto helper = ctx.router.service_helper();
        if (helper.is_err()) return io_failure(helper.error);
        if (helper.value) progressed = true;

        auto pumped = ctx.router.pump_to_channel();
        if (pumped.is_err()) return io_failure(pumped.error);

        auto flushed = ctx.terminal.flush(LOCAL_WRITE_TIMEOUT_MS);
        if (flushed.is_err()) return io_failure(flushed.error);

        if (remote_eof) return ended(LoopExit::REMOTE_EOF);
        if (!progressed) wait_for_activity(ctx);
    }
}
