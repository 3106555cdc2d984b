#include "terminal.hpp"
#include <core/constants.hpp>
#include <sys/ioctl.h>
#include <termios.h>
#include <unistd.h>
#include <atomic>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <mutex>

namespace platform {

// ── Terminal dimensions ──────────────────────────────────────

TermSize terminal_size(int fd) {
    struct winsize ws;
    if (ioctl(fd, TIOCGWINSZ, &ws) == 0 && ws.ws_col > 0 && ws.ws_row > 0)
        return TermSize{ws.ws_col, ws.ws_row};
    return TermSize{DEFAULT_TERM_COLS, DEFAULT_TERM_ROWS};
}

// ── TerminalGuard ────────────────────────────────────────────

struct TerminalGuard::Impl {
    struct termios old_term;
};

static std::atomic<int> g_entered{0};
static std::atomic<int> g_restored{0};

// The one live guard, restored from atexit if the process exits while raw.
static std::mutex g_live_mutex;
static TerminalGuard* g_live_guard = nullptr;
static std::once_flag g_atexit_once;

static void restore_live_guard_at_exit() {
    TerminalGuard* guard = nullptr;
    {
        std::lock_guard<std::mutex> lock(g_live_mutex);
        guard = g_live_guard;
    }
    if (guard) guard->release();
}

Result<std::unique_ptr<TerminalGuard>> TerminalGuard::acquire(int fd) {
    using R = Result<std::unique_ptr<TerminalGuard>>;

    std::lock_guard<std::mutex> lock(g_live_mutex);
    if (g_live_guard) {
        return R::Err(ErrorKind::TERMINAL, "terminal is already in raw mode");
    }

    auto impl = std::make_unique<Impl>();
    if (tcgetattr(fd, &impl->old_term) != 0) {
        return R::Err(ErrorKind::TERMINAL,
                      std::string("cannot read terminal attributes: ") + std::strerror(errno));
    }

    struct termios raw = impl->old_term;
    cfmakeraw(&raw);
    if (tcsetattr(fd, TCSANOW, &raw) != 0) {
        int err = errno;
        // A failed tcsetattr may have applied part of the change
        tcsetattr(fd, TCSANOW, &impl->old_term);
        return R::Err(ErrorKind::TERMINAL,
                      std::string("cannot enter raw mode: ") + std::strerror(err));
    }
    g_entered++;

    std::call_once(g_atexit_once, [] { std::atexit(restore_live_guard_at_exit); });

    std::unique_ptr<TerminalGuard> guard(new TerminalGuard(fd, std::move(impl)));
    g_live_guard = guard.get();
    return R::Ok(std::move(guard));
}

TerminalGuard::TerminalGuard(int fd, std::unique_ptr<Impl> impl)
    : fd_(fd), impl_(std::move(impl)) {}

TerminalGuard::~TerminalGuard() {
    release();
}

void TerminalGuard::release() {
    std::lock_guard<std::mutex> lock(g_live_mutex);
    if (!active_) return;
    active_ = false;
    tcsetattr(fd_, TCSANOW, &impl_->old_term);
    g_restored++;
    if (g_live_guard == this) g_live_guard = nullptr;
}

TerminalGuard::Stats TerminalGuard::stats() {
    return Stats{g_entered.load(), g_restored.load()};
}

void TerminalGuard::reset_stats() {
    g_entered = 0;
    g_restored = 0;
}

} // namespace platform
