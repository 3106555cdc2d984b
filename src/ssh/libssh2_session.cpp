#include "libssh2_session.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <libssh2.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>
#include <mutex>
#include <fmt/format.h>

// Data passed to keyboard-interactive callback via session abstract pointer
struct KbdAuthData {
    std::string password;
    int prompt_round;
    StatusCallback callback;
};

// libssh2 keyboard-interactive callback: every prompt gets the same secret
static void kbd_callback(const char* /*name*/, int /*name_len*/,
                          const char* /*instruction*/, int /*instruction_len*/,
                          int num_prompts,
                          const LIBSSH2_USERAUTH_KBDINT_PROMPT* prompts,
                          LIBSSH2_USERAUTH_KBDINT_RESPONSE* responses,
                          void** abstract) {
    KbdAuthData* data = static_cast<KbdAuthData*>(*abstract);

    for (int i = 0; i < num_prompts; i++) {
        std::string prompt_text(reinterpret_cast<const char*>(prompts[i].text), prompts[i].length);
        if (data->callback) data->callback("Answering prompt: " + prompt_text);
        responses[i].text = strdup(data->password.c_str());
        responses[i].length = static_cast<unsigned int>(data->password.length());
    }
    data->prompt_round++;
}

static void ensure_libssh2_init() {
    static std::once_flag once;
    std::call_once(once, [] { libssh2_init(0); });
}

Libssh2Session::Libssh2Session(WaitFn wait) : wait_(std::move(wait)) {}

Libssh2Session::~Libssh2Session() {
    disconnect();
}

Result<void> Libssh2Session::wait_socket() {
    int dirs = session_ ? libssh2_session_block_directions(session_) : 0;
    if (dirs == 0) dirs = LIBSSH2_SESSION_BLOCK_INBOUND;
    return wait_(dirs);
}

std::string Libssh2Session::last_error() const {
    if (!session_) return "no session";
    char* msg = nullptr;
    int len = 0;
    libssh2_session_last_error(session_, &msg, &len, 0);
    return msg ? std::string(msg, len) : std::string("unknown error");
}

// ── Handshake ────────────────────────────────────────────────

Result<void> Libssh2Session::handshake(int sock) {
    ensure_libssh2_init();

    session_ = libssh2_session_init_ex(nullptr, nullptr, nullptr, nullptr);
    if (!session_) {
        return Result<void>::Err(ErrorKind::TRANSPORT, "Failed to create SSH session");
    }
    sock_ = sock;
    libssh2_session_set_blocking(session_, 0);

    // SSH handshake (key exchange)
    int rc;
    while ((rc = libssh2_session_handshake(session_, sock_)) == LIBSSH2_ERROR_EAGAIN) {
        auto w = wait_socket();
        if (w.is_err()) return w;
    }
    if (rc != 0) {
        return Result<void>::Err(ErrorKind::TRANSPORT,
                                 fmt::format("SSH handshake failed: {}", last_error()));
    }

    // Enable SSH keepalive
    libssh2_keepalive_config(session_, 1, SSH_KEEPALIVE_SECS);
    return Result<void>::Ok();
}

// ── Authentication ───────────────────────────────────────────

std::string Libssh2Session::auth_methods(const std::string& user) {
    char* auth_list = nullptr;
    while ((auth_list = libssh2_userauth_list(session_, user.c_str(),
                                              static_cast<unsigned int>(user.length()))) == nullptr) {
        if (libssh2_session_last_errno(session_) != LIBSSH2_ERROR_EAGAIN) break;
        if (wait_socket().is_err()) break;
    }
    return auth_list ? auth_list : "";
}

Result<void> Libssh2Session::authenticate(const ConnectTarget& target, StatusCallback callback) {
    const std::string& user = target.username;

    // Check what auth methods the server supports
    std::string methods = auth_methods(user);
    if (methods.empty() && libssh2_userauth_authenticated(session_)) {
        rzterm_log("auth: server accepted 'none' authentication");
        return Result<void>::Ok();
    }
    rzterm_log(fmt::format("auth: methods offered: {}", methods.empty() ? "?" : methods));
    if (callback && !methods.empty()) callback("Auth methods: " + methods);

    if (auto* pw = std::get_if<PasswordCredential>(&target.credential)) {
        return auth_password(user, pw->secret, methods, callback);
    }
    if (auto* key = std::get_if<KeyFileCredential>(&target.credential)) {
        return auth_key(user, *key, methods, callback);
    }
    return auth_agent(user, callback);
}

Result<void> Libssh2Session::auth_password(const std::string& user, const std::string& secret,
                                           const std::string& methods, StatusCallback callback) {
    int rc = LIBSSH2_ERROR_AUTHENTICATION_FAILED;

    if (methods.empty() || methods.find("password") != std::string::npos) {
        if (callback) callback("Using password auth...");
        while ((rc = libssh2_userauth_password(session_, user.c_str(), secret.c_str()))
               == LIBSSH2_ERROR_EAGAIN) {
            auto w = wait_socket();
            if (w.is_err()) return w;
        }
        if (rc == 0) return Result<void>::Ok();
        rzterm_log(fmt::format("auth: password rejected ({})", rc));
    }

    // Servers that only take passwords through keyboard-interactive
    if (methods.find("keyboard-interactive") != std::string::npos) {
        auto kbd = auth_keyboard_interactive(user, secret, callback);
        if (kbd.is_ok()) return kbd;
        if (kbd.error.kind != ErrorKind::AUTH) return kbd;
    }

    return Result<void>::Err(auth_error(AuthReason::PASSWORD_REJECTED,
                                        "Authentication failed (check username/password)"));
}

Result<void> Libssh2Session::auth_keyboard_interactive(const std::string& user,
                                                       const std::string& secret,
                                                       StatusCallback callback) {
    if (callback) callback("Using keyboard-interactive auth...");

    // Set up callback data via session abstract pointer
    KbdAuthData kbd_data;
    kbd_data.password = secret;
    kbd_data.prompt_round = 0;
    kbd_data.callback = callback;

    void** abstract = libssh2_session_abstract(session_);
    void* previous = *abstract;
    *abstract = &kbd_data;

    int rc;
    Result<void> waited = Result<void>::Ok();
    while ((rc = libssh2_userauth_keyboard_interactive(session_, user.c_str(), kbd_callback))
           == LIBSSH2_ERROR_EAGAIN) {
        waited = wait_socket();
        if (waited.is_err()) break;
    }
    *abstract = previous;

    if (waited.is_err()) return waited;
    if (rc == 0) return Result<void>::Ok();
    rzterm_log(fmt::format("auth: keyboard-interactive rejected after {} round(s)",
                           kbd_data.prompt_round));
    return Result<void>::Err(auth_error(AuthReason::PASSWORD_REJECTED,
                                        "Keyboard-interactive authentication failed"));
}

Result<void> Libssh2Session::auth_key(const std::string& user, const KeyFileCredential& cred,
                                      const std::string& methods, StatusCallback callback) {
    std::string path = expand_tilde(cred.path);
    SessionError failure;

    if (access(path.c_str(), R_OK) != 0) {
        failure = auth_error(AuthReason::KEY_UNREADABLE,
                             fmt::format("Cannot read private key {}: {}", path, std::strerror(errno)));
    } else {
        if (callback) callback("Using public key " + path + "...");
        int rc;
        while ((rc = libssh2_userauth_publickey_fromfile(session_, user.c_str(), nullptr,
                                                         path.c_str(), nullptr))
               == LIBSSH2_ERROR_EAGAIN) {
            auto w = wait_socket();
            if (w.is_err()) return w;
        }
        if (rc == 0) return Result<void>::Ok();

        if (rc == LIBSSH2_ERROR_FILE) {
            failure = auth_error(AuthReason::KEY_UNREADABLE,
                                 fmt::format("Unable to load private key {}: {}", path, last_error()));
        } else {
            failure = auth_error(AuthReason::KEY_REJECTED,
                                 fmt::format("Public key {} rejected: {}", path, last_error()));
        }
    }
    rzterm_log("auth: " + failure.message);

    if (cred.fallback_secret) {
        if (callback) callback("Key failed, falling back to password...");
        return auth_password(user, *cred.fallback_secret, methods, callback);
    }
    return Result<void>::Err(failure);
}

Result<void> Libssh2Session::auth_agent(const std::string& user, StatusCallback callback) {
    LIBSSH2_AGENT* agent = libssh2_agent_init(session_);
    if (!agent) {
        return Result<void>::Err(auth_error(AuthReason::AGENT_UNAVAILABLE,
                                            "Failed to initialise ssh-agent support"));
    }

    auto release = [&] {
        libssh2_agent_disconnect(agent);
        libssh2_agent_free(agent);
    };

    if (libssh2_agent_connect(agent) != 0) {
        libssh2_agent_free(agent);
        return Result<void>::Err(auth_error(AuthReason::AGENT_UNAVAILABLE,
                                            "Cannot connect to ssh-agent (is SSH_AUTH_SOCK set?)"));
    }
    if (libssh2_agent_list_identities(agent) != 0) {
        release();
        return Result<void>::Err(auth_error(AuthReason::AGENT_UNAVAILABLE,
                                            "Failed to list ssh-agent identities"));
    }

    if (callback) callback("Trying ssh-agent identities...");

    struct libssh2_agent_publickey* identity = nullptr;
    struct libssh2_agent_publickey* prev = nullptr;
    int tried = 0;
    for (;;) {
        int rc = libssh2_agent_get_identity(agent, &identity, prev);
        if (rc == 1) break;  // end of list
        if (rc < 0) {
            release();
            return Result<void>::Err(auth_error(AuthReason::AGENT_UNAVAILABLE,
                                                "Failed to read ssh-agent identity"));
        }
        tried++;

        int auth_rc;
        while ((auth_rc = libssh2_agent_userauth(agent, user.c_str(), identity))
               == LIBSSH2_ERROR_EAGAIN) {
            auto w = wait_socket();
            if (w.is_err()) {
                release();
                return w;
            }
        }
        if (auth_rc == 0) {
            rzterm_log(fmt::format("auth: agent identity '{}' accepted",
                                   identity->comment ? identity->comment : ""));
            release();
            return Result<void>::Ok();
        }
        prev = identity;
    }

    release();
    return Result<void>::Err(auth_error(AuthReason::NO_IDENTITY_ACCEPTED,
                                        fmt::format("No ssh-agent identity accepted ({} tried)", tried)));
}

// ── Channels ─────────────────────────────────────────────────

Result<LIBSSH2_CHANNEL*> Libssh2Session::open_channel() {
    LIBSSH2_CHANNEL* ch = nullptr;
    while ((ch = libssh2_channel_open_session(session_)) == nullptr) {
        if (libssh2_session_last_errno(session_) != LIBSSH2_ERROR_EAGAIN) {
            return Result<LIBSSH2_CHANNEL*>::Err(
                ErrorKind::CHANNEL, fmt::format("Failed to open SSH channel: {}", last_error()));
        }
        auto w = wait_socket();
        if (w.is_err()) return Result<LIBSSH2_CHANNEL*>::Err(w.error);
    }
    return Result<LIBSSH2_CHANNEL*>::Ok(ch);
}

Result<void> Libssh2Session::request_pty(LIBSSH2_CHANNEL* ch, const std::string& term,
                                         platform::TermSize size) {
    int rc;
    while ((rc = libssh2_channel_request_pty_ex(
                ch, term.c_str(), static_cast<unsigned int>(term.length()),
                nullptr, 0, size.cols, size.rows, 0, 0)) == LIBSSH2_ERROR_EAGAIN) {
        auto w = wait_socket();
        if (w.is_err()) return w;
    }
    if (rc != 0) {
        return Result<void>::Err(ErrorKind::CHANNEL,
                                 fmt::format("PTY request refused: {}", last_error()));
    }
    return Result<void>::Ok();
}

Result<void> Libssh2Session::start_shell(LIBSSH2_CHANNEL* ch) {
    int rc;
    while ((rc = libssh2_channel_shell(ch)) == LIBSSH2_ERROR_EAGAIN) {
        auto w = wait_socket();
        if (w.is_err()) return w;
    }
    if (rc != 0) {
        return Result<void>::Err(ErrorKind::CHANNEL,
                                 fmt::format("Failed to request shell: {}", last_error()));
    }
    return Result<void>::Ok();
}

Result<void> Libssh2Session::start_exec(LIBSSH2_CHANNEL* ch, const std::string& command) {
    int rc;
    while ((rc = libssh2_channel_exec(ch, command.c_str())) == LIBSSH2_ERROR_EAGAIN) {
        auto w = wait_socket();
        if (w.is_err()) return w;
    }
    if (rc != 0) {
        return Result<void>::Err(ErrorKind::CHANNEL,
                                 fmt::format("Failed to execute '{}': {}", command, last_error()));
    }
    return Result<void>::Ok();
}

void Libssh2Session::disconnect() {
    if (!session_) return;

    // Bounded: a dead peer must not stall teardown
    for (int i = 0; i < 10; i++) {
        int rc = libssh2_session_disconnect(session_, "Normal disconnection");
        if (rc != LIBSSH2_ERROR_EAGAIN) break;
        if (wait_socket().is_err()) break;
    }
    libssh2_session_free(session_);
    session_ = nullptr;
    sock_ = -1;
}
