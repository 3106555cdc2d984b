#include "helper_launcher.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <platform/nonblocking_io.hpp>
#include <filesystem>
#include <fmt/format.h>

namespace fs = std::filesystem;

// Five consecutive CAN bytes abort a ZMODEM session
static const int ABORT_CAN_COUNT = 5;
static const int PROMPT_TIMEOUT_MS = 100;

static bool show(int fd, const std::string& text) {
    auto r = platform::write_all(fd, text.data(), text.size(), 1000);
    if (r.is_err()) rzterm_log("prompt echo failed: " + r.error.message);
    return r.is_ok();
}

HelperLauncher::HelperLauncher(const Settings& settings, int in_fd, int out_fd,
                               const CancellationToken* cancel)
    : settings_(settings), in_fd_(in_fd), out_fd_(out_fd), cancel_(cancel) {}

std::string HelperLauncher::abort_sequence() {
    return std::string(ABORT_CAN_COUNT, '\x18');
}

void HelperLauncher::notice(const std::string& msg) {
    show(out_fd_, "\r\nrzterm: " + msg + "\r\n");
}

// ── Path selection ───────────────────────────────────────────

InputWait HelperLauncher::wait_input(int fd) {
    if (waiter_) return waiter_(fd, PROMPT_TIMEOUT_MS);
    return platform::wait_readable(fd, PROMPT_TIMEOUT_MS) ? InputWait::READY : InputWait::TIMEOUT;
}

std::optional<std::string> HelperLauncher::run_picker() {
    if (settings_.upload_picker.empty()) return std::nullopt;

    platform::SpawnOptions options;
    options.pipe_stdout = true;
    auto child = platform::spawn("/bin/sh", {"-c", settings_.upload_picker}, options);
    if (child.is_err()) {
        rzterm_log("picker failed to start: " + child.error.message);
        return std::nullopt;
    }
    platform::ProcessHandle picker = std::move(child.value);
    platform::set_nonblocking(picker.stdout_fd());

    std::string out;
    char buf[512];
    for (;;) {
        if (cancelled()) {
            rzterm_log("picker stopped: session cancelled");
            picker.terminate();
            return std::nullopt;
        }
        InputWait w = wait_input(picker.stdout_fd());
        if (w == InputWait::STOPPED) {
            rzterm_log("picker stopped: loop ended");
            picker.terminate();
            return std::nullopt;
        }
        if (w == InputWait::TIMEOUT) continue;

        auto r = platform::read_nonblocking(picker.stdout_fd(), buf, sizeof(buf));
        if (r.status == platform::IoStatus::DATA) {
            out.append(buf, r.n);
            continue;
        }
        if (r.status == platform::IoStatus::WOULD_BLOCK) continue;
        break;  // EOF or read error: the picker is done
    }

    int code = picker.wait();
    if (code != 0) {
        rzterm_log(fmt::format("picker exited with {}", code));
        return std::nullopt;
    }
    trim(out);
    if (out.empty()) return std::nullopt;
    return out;
}

std::optional<std::string> HelperLauncher::prompt_line(const std::string& question) {
    if (!show(out_fd_, "\r\n" + question)) return std::nullopt;

    std::string line;
    char buf[64];
    for (;;) {
        if (cancelled()) return std::nullopt;
        InputWait w = wait_input(in_fd_);
        if (w == InputWait::STOPPED) return std::nullopt;
        if (w == InputWait::TIMEOUT) continue;

        auto r = platform::read_nonblocking(in_fd_, buf, sizeof(buf));
        if (r.status == platform::IoStatus::WOULD_BLOCK) continue;
        if (r.status != platform::IoStatus::DATA) return std::nullopt;

        std::string echo;
        for (std::size_t i = 0; i < r.n; i++) {
            char c = buf[i];
            if (c == '\r' || c == '\n') {
                show(out_fd_, echo + "\r\n");
                return line;
            }
            if (c == 0x03 || (c == 0x04 && line.empty())) {  // Ctrl-C, Ctrl-D
                show(out_fd_, echo + "^C\r\n");
                return std::nullopt;
            }
            if (c == 0x7f || c == 0x08) {
                if (!line.empty()) {
                    line.pop_back();
                    echo += "\b \b";
                }
                continue;
            }
            if (static_cast<unsigned char>(c) < 0x20) continue;
            line += c;
            echo += c;
        }
        if (!echo.empty()) show(out_fd_, echo);
    }
}

std::optional<std::string> HelperLauncher::ask_path(const std::string& question) {
    if (prompt_) return prompt_(question);
    if (auto picked = run_picker()) return picked;
    return prompt_line(question);
}

// ── Plan + launch ────────────────────────────────────────────

Result<TransferPlan> HelperLauncher::prepare(const DetectionEvent& event) {
    TransferPlan plan;
    plan.kind = event.kind;

    if (event.kind == DetectionKind::UPLOAD) {
        auto answer = ask_path("local file to upload (empty to cancel): ");
        std::string path = answer ? *answer : "";
        trim(path);
        if (path.empty()) {
            rzterm_log("upload cancelled: no path given");
            plan.aborted = true;
            return Result<TransferPlan>::Ok(plan);
        }
        path = expand_tilde(path);
        std::error_code ec;
        if (!fs::is_regular_file(path, ec)) {
            notice(fmt::format("not a file: {}", path));
            rzterm_log("upload cancelled: not a file: " + path);
            plan.aborted = true;
            return Result<TransferPlan>::Ok(plan);
        }
        plan.local_path = path;
        plan.program = settings_.send_helper;
        plan.args = settings_.send_helper_args;
        plan.args.push_back(path);
        return Result<TransferPlan>::Ok(plan);
    }

    plan.program = settings_.receive_helper;
    plan.args = settings_.receive_helper_args;
    if (!settings_.download_dir.empty()) {
        plan.working_dir = expand_tilde(settings_.download_dir);
        std::error_code ec;
        fs::create_directories(plan.working_dir, ec);
        if (ec) {
            return Result<TransferPlan>::Err(ErrorKind::SUBPROCESS,
                                             fmt::format("Cannot use download directory {}: {}",
                                                         plan.working_dir, ec.message()));
        }
    }
    if (!event.argument.empty()) {
        rzterm_log("remote is sending: " + event.argument);
    }
    return Result<TransferPlan>::Ok(plan);
}

Result<platform::ProcessHandle> HelperLauncher::launch(const TransferPlan& plan) {
    platform::SpawnOptions options;
    options.pipe_stdin = true;
    options.pipe_stdout = true;
    options.working_dir = plan.working_dir;

    std::string cmdline = plan.program;
    for (const auto& a : plan.args) cmdline += " " + a;
    rzterm_log("helper: " + cmdline +
               (plan.working_dir.empty() ? "" : " (in " + plan.working_dir + ")"));

    auto proc = platform::spawn(plan.program, plan.args, options);
    if (proc.is_err()) return proc;

    platform::set_nonblocking(proc.value.stdin_fd());
    platform::set_nonblocking(proc.value.stdout_fd());
    return proc;
}
