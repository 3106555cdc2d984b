#pragma once

#include <string>
#include <core/types.hpp>
#include <core/target.hpp>
#include <platform/terminal.hpp>
#include "channel.hpp"

// Authenticated SSH connection that hands out one Channel at a time.
//
// The transport owns the channel it returns; the pointer stays valid until
// disconnect() or destruction. Errors: connect -> TRANSPORT, authenticate ->
// AUTH, open_shell / exec -> CHANNEL.
class Transport {
public:
    virtual ~Transport() = default;

    virtual Result<void> connect(const ConnectTarget& target) = 0;
    virtual Result<void> authenticate(const ConnectTarget& target) = 0;

    // PTY + interactive shell.
    virtual Result<Channel*> open_shell(const std::string& term, platform::TermSize size) = 0;

    // Single command, no PTY.
    virtual Result<Channel*> exec(const std::string& command) = 0;

    // Close the channel (if still open) and the connection. Idempotent.
    virtual void disconnect() = 0;

    virtual TransportBackend backend() const = 0;
};
