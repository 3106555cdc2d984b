#pragma once

#include <atomic>
#include <signal.h>

// Cooperative cancellation flag, passed explicitly to whoever must honour it.
// The interactive loops check it once per iteration.
class CancellationToken {
public:
    void cancel() { flag_.store(true); }
    bool cancelled() const { return flag_.load(); }
    void reset() { flag_.store(false); }

private:
    friend class SignalCancellation;
    std::atomic<bool> flag_{false};
};

// Binds SIGINT, SIGTERM and SIGHUP to one token for the lifetime of the scope
// and restores the previous handlers afterwards. Only one binding at a time.
class SignalCancellation {
public:
    explicit SignalCancellation(CancellationToken& token);
    ~SignalCancellation();

    SignalCancellation(const SignalCancellation&) = delete;
    SignalCancellation& operator=(const SignalCancellation&) = delete;

    // Last signal delivered while bound (0 if none).
    static int last_signal();

private:
    struct sigaction old_int_;
    struct sigaction old_term_;
    struct sigaction old_hup_;
};
