#include "types.hpp"

const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::NONE:       return "none";
    case ErrorKind::TRANSPORT:  return "transport";
    case ErrorKind::AUTH:       return "auth";
    case ErrorKind::CHANNEL:    return "channel";
    case ErrorKind::TERMINAL:   return "terminal";
    case ErrorKind::SUBPROCESS: return "subprocess";
    case ErrorKind::IO:         return "io";
    case ErrorKind::CONFIG:     return "config";
    case ErrorKind::CANCELLED:  return "cancelled";
    }
    return "unknown";
}

const char* auth_reason_name(AuthReason reason) {
    switch (reason) {
    case AuthReason::NONE:                 return "none";
    case AuthReason::PASSWORD_REJECTED:    return "password_rejected";
    case AuthReason::KEY_UNREADABLE:       return "key_unreadable";
    case AuthReason::KEY_REJECTED:         return "key_rejected";
    case AuthReason::AGENT_UNAVAILABLE:    return "agent_unavailable";
    case AuthReason::NO_IDENTITY_ACCEPTED: return "no_identity_accepted";
    }
    return "unknown";
}

std::string describe(const SessionError& err) {
    std::string out = error_kind_name(err.kind);
    if (err.kind == ErrorKind::AUTH && err.auth_reason != AuthReason::NONE) {
        out += "(";
        out += auth_reason_name(err.auth_reason);
        out += ")";
    }
    if (!err.message.empty()) {
        out += ": " + err.message;
    }
    return out;
}
