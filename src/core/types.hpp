#pragma once

#include <string>
#include <functional>

// Error taxonomy shared by every layer.
enum class ErrorKind {
    NONE,
    TRANSPORT,   // connect refused, resolve failed, handshake failed, timeout
    AUTH,        // credential rejected (see AuthReason)
    CHANNEL,     // PTY / shell / exec request refused by the remote
    TERMINAL,    // cannot query or set local terminal attributes
    SUBPROCESS,  // helper failed to spawn or exited non-zero
    IO,          // local or remote descriptor fault (not WouldBlock / EOF)
    CONFIG,      // malformed target, unsupported backend + credential pair
    CANCELLED,
};

enum class AuthReason {
    NONE,
    PASSWORD_REJECTED,
    KEY_UNREADABLE,
    KEY_REJECTED,
    AGENT_UNAVAILABLE,
    NO_IDENTITY_ACCEPTED,
};

struct SessionError {
    ErrorKind kind = ErrorKind::NONE;
    AuthReason auth_reason = AuthReason::NONE;
    std::string message;
};

const char* error_kind_name(ErrorKind kind);
const char* auth_reason_name(AuthReason reason);

// "transport: Connection refused", "auth(no_identity_accepted): ..."
std::string describe(const SessionError& err);

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    SessionError error;

    static Result<T> Ok(T val) {
        return {true, std::move(val), SessionError{}};
    }

    static Result<T> Err(SessionError err) {
        return {false, T{}, std::move(err)};
    }

    static Result<T> Err(ErrorKind kind, const std::string& msg) {
        return {false, T{}, SessionError{kind, AuthReason::NONE, msg}};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    SessionError error;

    static Result<void> Ok() {
        return {true, SessionError{}};
    }

    static Result<void> Err(SessionError err) {
        return {false, std::move(err)};
    }

    static Result<void> Err(ErrorKind kind, const std::string& msg) {
        return {false, SessionError{kind, AuthReason::NONE, msg}};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

inline SessionError auth_error(AuthReason reason, const std::string& msg) {
    return SessionError{ErrorKind::AUTH, reason, msg};
}

// Non-interactive command execution result
struct ExecResult {
    int exit_code;
    std::string stdout_data;
    std::string stderr_data;

    bool success() const { return exit_code == 0; }
    bool failed() const { return exit_code != 0; }
};

// Status callback for progress messages during connect
using StatusCallback = std::function<void(const std::string&)>;
