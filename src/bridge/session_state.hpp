#pragma once

#include <atomic>
#include <mutex>
#include <vector>
#include <core/types.hpp>

enum class SessionState {
    IDLE,
    CONNECTING,
    AUTHENTICATING,
    SHELL_REQUESTED,
    INTERACTIVE,
    TRANSFER_ACTIVE,
    EXECUTING,
    CLOSING,
    TERMINATED,
    FAILED,
};

const char* state_name(SessionState state);

// Lifecycle of one session:
//
//   IDLE -> CONNECTING -> AUTHENTICATING -> SHELL_REQUESTED -> INTERACTIVE
//   INTERACTIVE <-> TRANSFER_ACTIVE
//   INTERACTIVE | TRANSFER_ACTIVE -> CLOSING -> TERMINATED
//   AUTHENTICATING -> EXECUTING -> TERMINATED
//   any non-terminal state -> FAILED
//
// Transitions not listed are rejected. state() may be read from any thread.
class SessionStateMachine {
public:
    SessionState state() const { return state_.load(); }

    bool can_transition(SessionState to) const;

    // CONFIG error (the state is unchanged) if the edge is not allowed.
    Result<void> transition(SessionState to);

    // Move to FAILED and remember why. Rejected once TERMINATED or FAILED.
    Result<void> fail(const SessionError& reason);

    bool finished() const;
    const SessionError& failure() const { return failure_; }
    std::vector<SessionState> history() const;

private:
    std::atomic<SessionState> state_{SessionState::IDLE};
    SessionError failure_;
    mutable std::mutex history_mutex_;
    std::vector<SessionState> history_{SessionState::IDLE};

    void record(SessionState from, SessionState to);
};
