#include "stream_router.hpp"
#include <core/constants.hpp>
#include <core/utils.hpp>
#include <platform/nonblocking_io.hpp>
#include <cstring>
#include <fmt/format.h>

using platform::IoStatus;

StreamRouter::StreamRouter(Channel& channel, LocalTerminal& terminal, SessionStateMachine& state,
                           HelperLauncher& launcher, TraceSink& trace)
    : channel_(channel), terminal_(terminal), state_(state), launcher_(launcher), trace_(trace) {}

StreamRouter::~StreamRouter() {
    abort_transfer();
}

void StreamRouter::queue_to_channel(const char* data, std::size_t len) {
    to_channel_.append(data, len);
}

// ── Local -> channel ─────────────────────────────────────────

Result<void> StreamRouter::on_local_input(const char* data, std::size_t len) {
    if (len == sizeof(TRACE_TOGGLE_KEY) &&
        std::memcmp(data, TRACE_TOGGLE_KEY, sizeof(TRACE_TOGGLE_KEY)) == 0) {
        trace_.toggle();
        return Result<void>::Ok();
    }

    if (trace_.enabled()) {
        trace_.trace(fmt::format("read {} bytes from local", len));
        trace_.trace("key codes: " + key_codes(data, len));
    }

    queue_to_channel(data, len);
    auto pumped = pump_to_channel();
    if (pumped.is_err()) return pumped;

    auto event = scan(Direction::OUTBOUND, data, len);
    if (event && state_.state() == SessionState::INTERACTIVE) {
        rzterm_log(fmt::format("detected {} command{}", detection_kind_name(event->kind),
                               event->argument.empty() ? "" : ": " + event->argument));
        return begin_transfer(*event, nullptr, 0);
    }
    return Result<void>::Ok();
}

Result<void> StreamRouter::pump_to_channel() {
    while (!to_channel_.empty()) {
        auto w = channel_.write(to_channel_.data(), to_channel_.size());
        if (w.status == IoStatus::ERROR) {
            return Result<void>::Err(ErrorKind::IO,
                                     fmt::format("Channel write failed: {}", std::strerror(w.err)));
        }
        if (w.status != IoStatus::DATA || w.n == 0) break;
        trace_.trace(fmt::format("wrote {} bytes to channel", w.n));
        to_channel_.erase(0, w.n);
    }
    return Result<void>::Ok();
}

// ── Channel -> terminal / helper ─────────────────────────────

Result<void> StreamRouter::on_remote_output(const char* data, std::size_t len) {
    if (helper_) {
        to_helper_.append(data, len);
        pump_to_helper();
        return Result<void>::Ok();
    }

    if (trace_.enabled()) {
        trace_.trace(fmt::format("read {} bytes from channel", len));
        trace_.trace("hex: " + hex_bytes(data, len));
    }

    auto event = scan(Direction::INBOUND, data, len);
    if (event && state_.state() == SessionState::INTERACTIVE) {
        rzterm_log(fmt::format("detected ZMODEM header at offset {}", event->offset));
        terminal_.write(data, event->offset);
        // Text before the header goes out ahead of anything the helper prints
        auto flushed = terminal_.flush(LOCAL_WRITE_TIMEOUT_MS);
        if (flushed.is_err()) return flushed;
        return begin_transfer(*event, data + event->offset, len - event->offset);
    }

    terminal_.write(data, len);
    return Result<void>::Ok();
}

void StreamRouter::pump_to_helper() {
    if (!helper_) {
        to_helper_.clear();
        return;
    }
    while (!to_helper_.empty()) {
        auto w = platform::write_some(helper_->stdin_fd(), to_helper_.data(), to_helper_.size());
        if (w.status == IoStatus::ERROR) {
            // Helper closed its stdin (usually: it is exiting)
            rzterm_log(fmt::format("helper stdin closed: {} ({} bytes dropped)",
                                   std::strerror(w.err), to_helper_.size()));
            to_helper_.clear();
            break;
        }
        if (w.status != IoStatus::DATA) break;
        to_helper_.erase(0, w.n);
    }
}

// ── Transfers ────────────────────────────────────────────────

Result<void> StreamRouter::begin_transfer(const DetectionEvent& event,
                                          const char* rest, std::size_t rest_len) {
    auto moved = state_.transition(SessionState::TRANSFER_ACTIVE);
    if (moved.is_err()) return moved;
    terminal_.hand_to_helper();
    transfer_count_++;

    auto plan = launcher_.prepare(event);
    if (plan.is_err()) {
        cancel_transfer(plan.error.message);
        return Result<void>::Ok();
    }
    if (plan.value.aborted) {
        cancel_transfer("upload cancelled");
        return Result<void>::Ok();
    }

    auto proc = launcher_.launch(plan.value);
    if (proc.is_err()) {
        cancel_transfer(proc.error.message);
        return Result<void>::Ok();
    }

    helper_ = std::make_unique<platform::ProcessHandle>(std::move(proc.value));
    helper_kind_ = event.kind;
    rzterm_log(fmt::format("{} helper started (pid {})", detection_kind_name(event.kind),
                           helper_->native_handle()));

    if (rest && rest_len > 0) {
        to_helper_.append(rest, rest_len);
        pump_to_helper();
    }
    return Result<void>::Ok();
}

void StreamRouter::cancel_transfer(const std::string& why) {
    rzterm_log("transfer not started: " + why);
    launcher_.notice("transfer cancelled (" + why + ")");

    std::string abort = HelperLauncher::abort_sequence();
    queue_to_channel(abort.data(), abort.size());

    terminal_.reclaim();
    auto back = state_.transition(SessionState::INTERACTIVE);
    if (back.is_err()) rzterm_log(back.error.message);
}

Result<bool> StreamRouter::service_helper() {
    if (!helper_) return Result<bool>::Ok(false);

    bool moved = false;
    char buf[HELPER_READ_BUF_SIZE];
    bool running = helper_->running();

    // After exit, everything left in the pipe is still owed to the remote
    for (;;) {
        auto r = platform::read_nonblocking(helper_->stdout_fd(), buf, sizeof(buf));
        if (r.status != IoStatus::DATA) break;
        queue_to_channel(buf, r.n);
        moved = true;
    }
    pump_to_helper();

    if (!running) {
        finish_transfer();
        moved = true;
    }

    auto pumped = pump_to_channel();
    if (pumped.is_err()) return Result<bool>::Err(pumped.error);
    return Result<bool>::Ok(moved);
}

void StreamRouter::finish_transfer() {
    int code = helper_->exit_code();
    rzterm_log(fmt::format("{} helper exited with {}", detection_kind_name(helper_kind_), code));
    helper_.reset();
    to_helper_.clear();

    terminal_.reclaim();
    auto back = state_.transition(SessionState::INTERACTIVE);
    if (back.is_err()) rzterm_log(back.error.message);
}

void StreamRouter::abort_transfer() {
    if (!helper_) return;
    rzterm_log("stopping transfer helper");
    helper_->terminate();
    helper_.reset();
    to_helper_.clear();
    terminal_.reclaim();
}
