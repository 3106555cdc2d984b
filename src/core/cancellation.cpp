#include "cancellation.hpp"
#include <cstring>

static std::atomic<bool>* g_bound_flag = nullptr;
static volatile sig_atomic_t g_last_signal = 0;

static void on_cancel_signal(int sig) {
    g_last_signal = sig;
    if (g_bound_flag) g_bound_flag->store(true);
}

SignalCancellation::SignalCancellation(CancellationToken& token) {
    g_bound_flag = &token.flag_;
    g_last_signal = 0;

    struct sigaction sa;
    std::memset(&sa, 0, sizeof(sa));
    sa.sa_handler = on_cancel_signal;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;  // no SA_RESTART: blocking poll() returns EINTR promptly

    sigaction(SIGINT, &sa, &old_int_);
    sigaction(SIGTERM, &sa, &old_term_);
    sigaction(SIGHUP, &sa, &old_hup_);
}

SignalCancellation::~SignalCancellation() {
    sigaction(SIGINT, &old_int_, nullptr);
    sigaction(SIGTERM, &old_term_, nullptr);
    sigaction(SIGHUP, &old_hup_, nullptr);
    g_bound_flag = nullptr;
}

int SignalCancellation::last_signal() {
    return g_last_signal;
}
