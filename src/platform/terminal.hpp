#pragma once

#include <memory>
#include <core/types.hpp>

namespace platform {

struct TermSize {
    int cols;
    int rows;
};

// Terminal dimensions of fd, or 80x24 when fd is not a terminal.
TermSize terminal_size(int fd);

// RAII guard for raw terminal mode.
// acquire() saves the current attributes of fd and enters raw mode
// (cfmakeraw: no echo, no canonical input, no signal characters).
// release() or the destructor restores the saved attributes exactly.
//
// The local terminal is a process-wide resource: at most one guard may be
// live at a time, and a live guard is also restored by an atexit hook.
class TerminalGuard {
public:
    static Result<std::unique_ptr<TerminalGuard>> acquire(int fd);
    ~TerminalGuard();

    TerminalGuard(const TerminalGuard&) = delete;
    TerminalGuard& operator=(const TerminalGuard&) = delete;

    // Restore the saved attributes. Second and later calls are no-ops.
    void release();

    bool active() const { return active_; }
    int fd() const { return fd_; }

    // Process-wide accounting of raw-mode transitions.
    struct Stats {
        int entered;
        int restored;
    };
    static Stats stats();
    static void reset_stats();

private:
    struct Impl;

    TerminalGuard(int fd, std::unique_ptr<Impl> impl);

    int fd_;
    bool active_ = true;
    std::unique_ptr<Impl> impl_;
};

} // namespace platform
