#include "session_state.hpp"
#include <core/log.hpp>
#include <fmt/format.h>

const char* state_name(SessionState state) {
    switch (state) {
        case SessionState::IDLE:            return "Idle";
        case SessionState::CONNECTING:      return "Connecting";
        case SessionState::AUTHENTICATING:  return "Authenticating";
        case SessionState::SHELL_REQUESTED: return "ShellRequested";
        case SessionState::INTERACTIVE:     return "Interactive";
        case SessionState::TRANSFER_ACTIVE: return "TransferActive";
        case SessionState::EXECUTING:       return "Executing";
        case SessionState::CLOSING:         return "Closing";
        case SessionState::TERMINATED:      return "Terminated";
        case SessionState::FAILED:          return "Failed";
    }
    return "?";
}

bool SessionStateMachine::finished() const {
    SessionState s = state();
    return s == SessionState::TERMINATED || s == SessionState::FAILED;
}

bool SessionStateMachine::can_transition(SessionState to) const {
    SessionState from = state();
    if (to == SessionState::FAILED) return !finished();

    switch (from) {
        case SessionState::IDLE:
            return to == SessionState::CONNECTING;
        case SessionState::CONNECTING:
            return to == SessionState::AUTHENTICATING;
        case SessionState::AUTHENTICATING:
            return to == SessionState::SHELL_REQUESTED || to == SessionState::EXECUTING;
        case SessionState::SHELL_REQUESTED:
            return to == SessionState::INTERACTIVE;
        case SessionState::INTERACTIVE:
            return to == SessionState::TRANSFER_ACTIVE || to == SessionState::CLOSING;
        case SessionState::TRANSFER_ACTIVE:
            return to == SessionState::INTERACTIVE || to == SessionState::CLOSING;
        case SessionState::EXECUTING:
        case SessionState::CLOSING:
            return to == SessionState::TERMINATED;
        case SessionState::TERMINATED:
        case SessionState::FAILED:
            return false;
    }
    return false;
}

void SessionStateMachine::record(SessionState from, SessionState to) {
    {
        std::lock_guard<std::mutex> lock(history_mutex_);
        history_.push_back(to);
    }
    rzterm_log(fmt::format("state: {} -> {}", state_name(from), state_name(to)));
}

Result<void> SessionStateMachine::transition(SessionState to) {
    SessionState from = state();
    if (to == SessionState::FAILED || !can_transition(to)) {
        return Result<void>::Err(ErrorKind::CONFIG,
                                 fmt::format("Illegal state transition {} -> {}",
                                             state_name(from), state_name(to)));
    }
    state_.store(to);
    record(from, to);
    return Result<void>::Ok();
}

Result<void> SessionStateMachine::fail(const SessionError& reason) {
    SessionState from = state();
    if (finished()) {
        return Result<void>::Err(ErrorKind::CONFIG,
                                 fmt::format("Cannot fail from {}", state_name(from)));
    }
    failure_ = reason;
    state_.store(SessionState::FAILED);
    record(from, SessionState::FAILED);
    rzterm_log("failure: " + describe(reason));
    return Result<void>::Ok();
}
