#pragma once

#include <string>
#include <vector>
#include <core/types.hpp>

namespace platform {

struct SpawnOptions {
    bool pipe_stdin = false;      // parent writes the child's stdin via stdin_fd()
    bool pipe_stdout = false;     // parent reads the child's stdout via stdout_fd()
    int stderr_fd = -1;           // if >= 0, becomes the child's stderr
    std::string stderr_log;       // if non-empty, child's stderr is appended here
    std::string working_dir;      // if non-empty, child chdirs here before exec
};

// Opaque handle to a spawned child process.
class ProcessHandle {
public:
    ProcessHandle();
    ~ProcessHandle();

    ProcessHandle(ProcessHandle&& other) noexcept;
    ProcessHandle& operator=(ProcessHandle&& other) noexcept;
    ProcessHandle(const ProcessHandle&) = delete;
    ProcessHandle& operator=(const ProcessHandle&) = delete;

    // True if the process handle is valid (was successfully spawned).
    bool valid() const;

    // True if the process is still running. Reaps it once it has exited.
    bool running();

    // Wait for the process to exit. Returns exit code (-1 if killed by a
    // signal). timeout_ms = -1 means indefinite wait; -1 is also returned
    // on timeout.
    int wait(int timeout_ms = -1);

    // Exit code of a reaped process, -1 if not reaped yet or signalled.
    int exit_code() const { return exit_code_; }

    // SIGTERM, then SIGKILL after 2s.
    void terminate();

    // Parent ends of the stdio pipes (-1 when not piped).
    int stdin_fd() const { return stdin_fd_; }
    int stdout_fd() const { return stdout_fd_; }

    // Close the parent's write end so the child sees EOF on stdin.
    void close_stdin();

    int native_handle() const { return pid_; }

private:
    int pid_ = -1;
    bool reaped_ = false;
    int exit_code_ = -1;
    int stdin_fd_ = -1;
    int stdout_fd_ = -1;

    void record_status(int status);
    void close_pipes();

    friend Result<ProcessHandle> spawn(const std::string& program,
                                       const std::vector<std::string>& args,
                                       const SpawnOptions& options);
};

// Spawn a child process (program is looked up in PATH).
// Fails with SUBPROCESS if the program cannot be executed.
Result<ProcessHandle> spawn(const std::string& program,
                            const std::vector<std::string>& args,
                            const SpawnOptions& options = SpawnOptions{});

// Replace the current process image. Only returns on failure.
Result<void> exec_replace(const std::string& program,
                          const std::vector<std::string>& args);

} // namespace platform
