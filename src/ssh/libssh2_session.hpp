#pragma once

#include <functional>
#include <string>
#include <core/types.hpp>
#include <core/target.hpp>
#include <platform/terminal.hpp>

// libssh2 forward declarations
typedef struct _LIBSSH2_SESSION LIBSSH2_SESSION;
typedef struct _LIBSSH2_CHANNEL LIBSSH2_CHANNEL;

// Called whenever libssh2 returns EAGAIN. directions is the
// LIBSSH2_SESSION_BLOCK_INBOUND / _OUTBOUND mask. Returning an error aborts
// the operation in progress (deadline passed, cancelled).
using WaitFn = std::function<Result<void>(int directions)>;

// Non-blocking libssh2 session over an already-connected socket.
// Every EAGAIN is routed through the WaitFn, so the same code drives the
// poll()-based and the coroutine-based transports.
class Libssh2Session {
public:
    explicit Libssh2Session(WaitFn wait);
    ~Libssh2Session();

    Libssh2Session(const Libssh2Session&) = delete;
    Libssh2Session& operator=(const Libssh2Session&) = delete;

    // Key exchange on sock. TRANSPORT error on failure.
    Result<void> handshake(int sock);

    // Authenticate with the target's credential. AUTH error with a reason.
    Result<void> authenticate(const ConnectTarget& target, StatusCallback callback = nullptr);

    // Channel setup. CHANNEL error on failure. The channel stays allocated;
    // the Libssh2Channel that wraps it frees it on close.
    Result<LIBSSH2_CHANNEL*> open_channel();
    Result<void> request_pty(LIBSSH2_CHANNEL* ch, const std::string& term, platform::TermSize size);
    Result<void> start_shell(LIBSSH2_CHANNEL* ch);
    Result<void> start_exec(LIBSSH2_CHANNEL* ch, const std::string& command);

    // Wait once for the socket, in whatever direction libssh2 is blocked on.
    Result<void> wait_socket();

    void disconnect();

    LIBSSH2_SESSION* raw() { return session_; }
    int socket() const { return sock_; }
    std::string last_error() const;

private:
    WaitFn wait_;
    LIBSSH2_SESSION* session_ = nullptr;
    int sock_ = -1;

    std::string auth_methods(const std::string& user);
    Result<void> auth_password(const std::string& user, const std::string& secret,
                               const std::string& methods, StatusCallback callback);
    Result<void> auth_keyboard_interactive(const std::string& user, const std::string& secret,
                                           StatusCallback callback);
    Result<void> auth_key(const std::string& user, const KeyFileCredential& cred,
                          const std::string& methods, StatusCallback callback);
    Result<void> auth_agent(const std::string& user, StatusCallback callback);
};
