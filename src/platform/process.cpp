#include "process.hpp"
#include "platform.hpp"
#include "nonblocking_io.hpp"
#include <unistd.h>
#include <sys/wait.h>
#include <signal.h>
#include <fcntl.h>
#include <cerrno>
#include <cstring>
#include <fmt/format.h>

namespace platform {

// ── ProcessHandle ────────────────────────────────────────────

ProcessHandle::ProcessHandle() = default;

ProcessHandle::~ProcessHandle() {
    close_pipes();
}

ProcessHandle::ProcessHandle(ProcessHandle&& other) noexcept
    : pid_(other.pid_), reaped_(other.reaped_), exit_code_(other.exit_code_),
      stdin_fd_(other.stdin_fd_), stdout_fd_(other.stdout_fd_) {
    other.pid_ = -1;
    other.stdin_fd_ = -1;
    other.stdout_fd_ = -1;
}

ProcessHandle& ProcessHandle::operator=(ProcessHandle&& other) noexcept {
    if (this != &other) {
        close_pipes();
        pid_ = other.pid_;
        reaped_ = other.reaped_;
        exit_code_ = other.exit_code_;
        stdin_fd_ = other.stdin_fd_;
        stdout_fd_ = other.stdout_fd_;
        other.pid_ = -1;
        other.stdin_fd_ = -1;
        other.stdout_fd_ = -1;
    }
    return *this;
}

bool ProcessHandle::valid() const {
    return pid_ > 0;
}

void ProcessHandle::record_status(int status) {
    reaped_ = true;
    exit_code_ = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
}

bool ProcessHandle::running() {
    if (pid_ <= 0 || reaped_) return false;
    int status;
    pid_t ret = waitpid(pid_, &status, WNOHANG);
    if (ret == pid_) {
        record_status(status);
        return false;
    }
    return ret == 0;  // 0 means still running
}

int ProcessHandle::wait(int timeout_ms) {
    if (pid_ <= 0) return -1;
    if (reaped_) return exit_code_;
    if (timeout_ms < 0) {
        int status;
        pid_t ret;
        do {
            ret = waitpid(pid_, &status, 0);
        } while (ret < 0 && errno == EINTR);
        if (ret == pid_) record_status(status);
        return exit_code_;
    }
    // Poll with timeout
    int elapsed = 0;
    while (elapsed < timeout_ms) {
        if (!running()) return exit_code_;
        sleep_ms(10);
        elapsed += 10;
    }
    return -1;  // timed out
}

void ProcessHandle::terminate() {
    if (pid_ <= 0 || reaped_) return;
    kill(pid_, SIGTERM);
    // Wait up to 2s for graceful exit
    for (int i = 0; i < 20; i++) {
        if (!running()) return;
        sleep_ms(100);
    }
    kill(pid_, SIGKILL);
    wait();
}

void ProcessHandle::close_stdin() {
    if (stdin_fd_ >= 0) {
        close(stdin_fd_);
        stdin_fd_ = -1;
    }
}

void ProcessHandle::close_pipes() {
    close_stdin();
    if (stdout_fd_ >= 0) {
        close(stdout_fd_);
        stdout_fd_ = -1;
    }
}

// ── spawn ────────────────────────────────────────────────────

static void close_pair(int fds[2]) {
    if (fds[0] >= 0) close(fds[0]);
    if (fds[1] >= 0) close(fds[1]);
}

Result<ProcessHandle> spawn(const std::string& program,
                            const std::vector<std::string>& args,
                            const SpawnOptions& options) {
    using R = Result<ProcessHandle>;

    int in_pipe[2] = {-1, -1};
    int out_pipe[2] = {-1, -1};
    int exec_pipe[2] = {-1, -1};   // reports exec failure (CLOEXEC)

    if ((options.pipe_stdin && pipe(in_pipe) != 0) ||
        (options.pipe_stdout && pipe(out_pipe) != 0) ||
        pipe2(exec_pipe, O_CLOEXEC) != 0) {
        int err = errno;
        close_pair(in_pipe);
        close_pair(out_pipe);
        close_pair(exec_pipe);
        return R::Err(ErrorKind::SUBPROCESS,
                      fmt::format("Failed to create pipes for {}: {}", program, std::strerror(err)));
    }

    // Build argv array before forking
    std::vector<const char*> argv;
    argv.push_back(program.c_str());
    for (const auto& a : args) argv.push_back(a.c_str());
    argv.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        int err = errno;
        close_pair(in_pipe);
        close_pair(out_pipe);
        close_pair(exec_pipe);
        return R::Err(ErrorKind::SUBPROCESS,
                      fmt::format("fork failed for {}: {}", program, std::strerror(err)));
    }

    if (pid == 0) {
        // Child process
        close(exec_pipe[0]);
        if (options.pipe_stdin) {
            dup2(in_pipe[0], STDIN_FILENO);
            close(in_pipe[0]);
            close(in_pipe[1]);
        }
        if (options.pipe_stdout) {
            dup2(out_pipe[1], STDOUT_FILENO);
            close(out_pipe[0]);
            close(out_pipe[1]);
        }
        if (options.stderr_fd >= 0) {
            dup2(options.stderr_fd, STDERR_FILENO);
        } else if (!options.stderr_log.empty()) {
            int fd = open(options.stderr_log.c_str(), O_WRONLY | O_CREAT | O_APPEND, 0644);
            if (fd >= 0) {
                dup2(fd, STDERR_FILENO);
                close(fd);
            }
        }
        if (!options.working_dir.empty() && chdir(options.working_dir.c_str()) != 0) {
            int err = errno;
            ssize_t ignored = write(exec_pipe[1], &err, sizeof(err));
            (void)ignored;
            _exit(127);
        }

        execvp(program.c_str(), const_cast<char* const*>(argv.data()));
        int err = errno;
        ssize_t ignored = write(exec_pipe[1], &err, sizeof(err));
        (void)ignored;
        _exit(127);  // exec failed
    }

    // Parent
    close(exec_pipe[1]);
    if (options.pipe_stdin) close(in_pipe[0]);
    if (options.pipe_stdout) close(out_pipe[1]);

    ProcessHandle handle;
    handle.pid_ = pid;
    handle.stdin_fd_ = options.pipe_stdin ? in_pipe[1] : -1;
    handle.stdout_fd_ = options.pipe_stdout ? out_pipe[0] : -1;

    // EOF on the exec pipe means execvp succeeded
    int child_err = 0;
    ssize_t n;
    do {
        n = read(exec_pipe[0], &child_err, sizeof(child_err));
    } while (n < 0 && errno == EINTR);
    close(exec_pipe[0]);

    if (n == static_cast<ssize_t>(sizeof(child_err))) {
        handle.wait();
        return R::Err(ErrorKind::SUBPROCESS,
                      fmt::format("Failed to start {}: {}", program, std::strerror(child_err)));
    }
    return R::Ok(std::move(handle));
}

Result<void> exec_replace(const std::string& program,
                          const std::vector<std::string>& args) {
    std::vector<const char*> argv;
    argv.push_back(program.c_str());
    for (const auto& a : args) argv.push_back(a.c_str());
    argv.push_back(nullptr);

    execvp(program.c_str(), const_cast<char* const*>(argv.data()));
    return Result<void>::Err(ErrorKind::SUBPROCESS,
                             fmt::format("Failed to exec {}: {}", program, std::strerror(errno)));
}

} // namespace platform
