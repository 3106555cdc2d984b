#include "session_bridge.hpp"
#include "async_loop.hpp"
#include "local_terminal.hpp"
#include "polling_loop.hpp"
#include "stream_router.hpp"
#include <core/constants.hpp>
#include <platform/platform.hpp>
#include <platform/terminal.hpp>
#include <chrono>
#include <cstring>
#include <poll.h>
#include <unistd.h>
#include <fmt/format.h>

using platform::IoStatus;

SessionBridge::SessionBridge(std::unique_ptr<Transport> transport, const Settings& settings,
                             CancellationToken& cancel, TraceSink& trace)
    : transport_(std::move(transport)), settings_(settings), cancel_(cancel), trace_(trace),
      in_fd_(STDIN_FILENO), out_fd_(STDOUT_FILENO) {}

SessionBridge::~SessionBridge() {
    if (transport_) transport_->disconnect();
}

void SessionBridge::set_terminal_fds(int in_fd, int out_fd) {
    in_fd_ = in_fd;
    out_fd_ = out_fd;
}

int SessionBridge::exit_code_for(const SessionError& err) {
    switch (err.kind) {
        case ErrorKind::NONE:      return 0;
        case ErrorKind::CONFIG:    return EXIT_CONFIG_ERROR;
        case ErrorKind::CANCELLED: return EXIT_CANCELLED;
        default:                   return EXIT_TRANSPORT_FAILURE;
    }
}

void SessionBridge::fail(const SessionError& err) {
    rzterm_log("session failed: " + describe(err));
    auto r = state_.fail(err);
    if (r.is_err()) rzterm_log(r.error.message);
}

// ── Connect + authenticate ───────────────────────────────────

Result<void> SessionBridge::establish(const ConnectTarget& target) {
    if (!transport_) return Result<void>::Err(ErrorKind::CONFIG, "No transport for this backend");

    auto valid = validate_target(target, transport_->backend());
    if (valid.is_err()) return valid;

    auto step = state_.transition(SessionState::CONNECTING);
    if (step.is_err()) return step;
    rzterm_log(fmt::format("connecting to {} ({} backend)", target.display(),
                           backend_name(transport_->backend())));

    auto connected = transport_->connect(target);
    if (connected.is_err()) return connected;
    if (cancel_.cancelled()) return Result<void>::Err(ErrorKind::CANCELLED, "Cancelled");

    step = state_.transition(SessionState::AUTHENTICATING);
    if (step.is_err()) return step;
    return transport_->authenticate(target);
}

// ── Interactive ──────────────────────────────────────────────

LoopOutcome SessionBridge::run_loop(LoopContext& ctx) {
    if (transport_->backend() == TransportBackend::ASYNC && ioc_) {
        AsyncLoop loop(*ioc_);
        return loop.run(ctx);
    }
    PollingLoop loop;
    return loop.run(ctx);
}

int SessionBridge::run_interactive(const ConnectTarget& target) {
    platform::ignore_sigpipe();

    auto est = establish(target);
    if (est.is_err()) {
        fail(est.error);
        if (transport_) transport_->disconnect();
        return exit_code_for(est.error);
    }

    auto step = state_.transition(SessionState::SHELL_REQUESTED);
    if (step.is_err()) {
        fail(step.error);
        transport_->disconnect();
        return exit_code_for(step.error);
    }

    platform::TermSize size = platform::terminal_size(out_fd_);
    auto shell = transport_->open_shell(settings_.term, size);
    if (shell.is_err()) {
        fail(shell.error);
        transport_->disconnect();
        return exit_code_for(shell.error);
    }
    Channel& channel = *shell.value;

    auto guard = platform::TerminalGuard::acquire(in_fd_);
    if (guard.is_err()) {
        auto closed = channel.close();
        if (closed.is_err()) rzterm_log("channel close: " + closed.error.message);
        transport_->disconnect();
        fail(guard.error);
        return exit_code_for(guard.error);
    }

    step = state_.transition(SessionState::INTERACTIVE);
    if (step.is_err()) {
        fail(step.error);
        auto closed = channel.close();
        if (closed.is_err()) rzterm_log("channel close: " + closed.error.message);
        transport_->disconnect();
        guard.value->release();
        return exit_code_for(step.error);
    }

    LoopOutcome outcome;
    {
        LocalTerminal terminal(in_fd_, out_fd_);
        HelperLauncher launcher(settings_, in_fd_, out_fd_, &cancel_);
        if (path_prompt_) launcher.set_path_prompt(path_prompt_);
        StreamRouter router(channel, terminal, state_, launcher, trace_);
        LoopContext ctx{channel, terminal, router, cancel_, trace_, settings_};

        outcome = run_loop(ctx);
        rzterm_log(fmt::format("bridge loop ended: {}", loop_exit_name(outcome.exit)));

        router.abort_transfer();
        auto flushed = terminal.flush(LOCAL_WRITE_TIMEOUT_MS);
        if (flushed.is_err()) rzterm_log("final flush: " + flushed.error.message);
    }

    // ── Teardown ──
    if (outcome.exit != LoopExit::IO_ERROR) {
        step = state_.transition(SessionState::CLOSING);
        if (step.is_err()) rzterm_log(step.error.message);
    }

    auto closed = channel.close();
    if (closed.is_err()) rzterm_log("channel close: " + closed.error.message);
    int remote_status = channel.exit_status();
    transport_->disconnect();

    guard.value->release();

    if (outcome.exit == LoopExit::IO_ERROR) {
        fail(outcome.error);
        return exit_code_for(outcome.error);
    }
    step = state_.transition(SessionState::TERMINATED);
    if (step.is_err()) rzterm_log(step.error.message);

    if (outcome.exit == LoopExit::CANCELLED) return EXIT_CANCELLED;
    rzterm_log(fmt::format("remote exit status {}", remote_status));
    return remote_status >= 0 ? remote_status : 0;
}

// ── Single command ───────────────────────────────────────────

Result<void> SessionBridge::collect_output(Channel& channel, ExecResult& result) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(EXEC_READ_TIMEOUT_SECS);
    char buf[CHANNEL_READ_BUF_SIZE];
    bool out_eof = false;
    bool err_eof = false;

    while (!out_eof || !err_eof) {
        if (cancel_.cancelled()) return Result<void>::Err(ErrorKind::CANCELLED, "Cancelled");
        bool progressed = false;

        while (!out_eof) {
            auto r = channel.read(buf, sizeof(buf));
            if (r.status == IoStatus::WOULD_BLOCK) break;
            if (r.status == IoStatus::END_OF_FILE) {
                out_eof = true;
                break;
            }
            if (r.status == IoStatus::ERROR) {
                return Result<void>::Err(ErrorKind::IO,
                                         fmt::format("Channel read failed: {}", std::strerror(r.err)));
            }
            result.stdout_data.append(buf, r.n);
            progressed = true;
        }
        while (!err_eof) {
            auto r = channel.read_stderr(buf, sizeof(buf));
            if (r.status == IoStatus::WOULD_BLOCK) break;
            if (r.status == IoStatus::END_OF_FILE) {
                err_eof = true;
                break;
            }
            if (r.status == IoStatus::ERROR) {
                return Result<void>::Err(ErrorKind::IO,
                                         fmt::format("Channel read failed: {}", std::strerror(r.err)));
            }
            result.stderr_data.append(buf, r.n);
            progressed = true;
        }

        if (std::chrono::steady_clock::now() >= deadline) {
            return Result<void>::Err(ErrorKind::TRANSPORT,
                                     fmt::format("Command timed out after {}s", EXEC_READ_TIMEOUT_SECS));
        }
        if (!progressed && (!out_eof || !err_eof)) {
            struct pollfd pfd = {channel.poll_fd(), POLLIN, 0};
            poll(&pfd, 1, settings_.poll_interval_ms);
        }
    }
    return Result<void>::Ok();
}

Result<ExecResult> SessionBridge::execute(const ConnectTarget& target, const std::string& command) {
    auto failed = [this](const SessionError& err) {
        fail(err);
        if (transport_) transport_->disconnect();
        return Result<ExecResult>::Err(err);
    };

    auto est = establish(target);
    if (est.is_err()) return failed(est.error);

    auto step = state_.transition(SessionState::EXECUTING);
    if (step.is_err()) return failed(step.error);

    rzterm_log("exec: " + command);
    auto ch = transport_->exec(command);
    if (ch.is_err()) return failed(ch.error);
    Channel& channel = *ch.value;

    ExecResult result{-1, "", ""};
    auto collected = collect_output(channel, result);
    if (collected.is_err()) return failed(collected.error);

    auto closed = channel.close();
    if (closed.is_err()) rzterm_log("channel close: " + closed.error.message);
    result.exit_code = channel.exit_status();
    transport_->disconnect();

    step = state_.transition(SessionState::TERMINATED);
    if (step.is_err()) rzterm_log(step.error.message);
    rzterm_log(fmt::format("exec finished with {} ({} bytes out, {} bytes err)", result.exit_code,
                           result.stdout_data.size(), result.stderr_data.size()));
    return Result<ExecResult>::Ok(result);
}
