#pragma once

#include <string>
#include <optional>
#include <variant>
#include "types.hpp"

// ── Credentials ─────────────────────────────────────────────
// Consumed once at authentication time, never written anywhere.

struct PasswordCredential {
    std::string secret;
};

struct KeyFileCredential {
    std::string path;                              // may start with "~"
    std::optional<std::string> fallback_secret;    // password tried if the key is refused
};

struct AgentCredential {};

using Credential = std::variant<PasswordCredential, KeyFileCredential, AgentCredential>;

const char* credential_name(const Credential& cred);

// ── Target ──────────────────────────────────────────────────

struct ConnectTarget {
    std::string host;
    int port = 22;
    std::string username;
    Credential credential = AgentCredential{};

    std::string display() const;   // user@host:port
};

enum class TransportBackend {
    LIBRARY,        // libssh2, poll-driven loop
    ASYNC,          // libssh2 driven by Boost.Asio coroutines
    EXEC_REPLACE,   // execvp the system ssh
    DEBUG,          // LIBRARY with tracing on from the start
};

const char* backend_name(TransportBackend backend);
Result<TransportBackend> parse_backend(const std::string& name);

// Malformed targets and unsupported backend + credential pairs are CONFIG
// errors, reported before any connection attempt.
Result<void> validate_target(const ConnectTarget& target, TransportBackend backend);

// "user@host", "user@host:port" or "host" (user from $USER). Agent credential.
Result<ConnectTarget> parse_target_spec(const std::string& spec);
