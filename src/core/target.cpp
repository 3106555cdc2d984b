#include "target.hpp"
#include "utils.hpp"
#include <cstdlib>
#include <fmt/format.h>

const char* credential_name(const Credential& cred) {
    switch (cred.index()) {
        case 0: return "password";
        case 1: return "key";
        default: return "agent";
    }
}

std::string ConnectTarget::display() const {
    return fmt::format("{}@{}:{}", username, host, port);
}

const char* backend_name(TransportBackend backend) {
    switch (backend) {
        case TransportBackend::LIBRARY:      return "library";
        case TransportBackend::ASYNC:        return "async";
        case TransportBackend::EXEC_REPLACE: return "exec";
        case TransportBackend::DEBUG:        return "debug";
    }
    return "library";
}

Result<TransportBackend> parse_backend(const std::string& name) {
    if (name.empty() || name == "library" || name == "libssh2")
        return Result<TransportBackend>::Ok(TransportBackend::LIBRARY);
    if (name == "async")
        return Result<TransportBackend>::Ok(TransportBackend::ASYNC);
    if (name == "exec" || name == "system" || name == "ssh")
        return Result<TransportBackend>::Ok(TransportBackend::EXEC_REPLACE);
    if (name == "debug")
        return Result<TransportBackend>::Ok(TransportBackend::DEBUG);
    return Result<TransportBackend>::Err(ErrorKind::CONFIG,
                                         fmt::format("Unknown backend: {}", name));
}

Result<void> validate_target(const ConnectTarget& target, TransportBackend backend) {
    if (target.host.empty())
        return Result<void>::Err(ErrorKind::CONFIG, "Target host is empty");
    if (target.host.find_first_of(" \t\r\n@") != std::string::npos)
        return Result<void>::Err(ErrorKind::CONFIG,
                                 fmt::format("Malformed host: '{}'", target.host));
    if (target.username.empty())
        return Result<void>::Err(ErrorKind::CONFIG, "Target username is empty");
    if (target.port < 1 || target.port > 65535)
        return Result<void>::Err(ErrorKind::CONFIG,
                                 fmt::format("Port out of range: {}", target.port));

    if (auto* key = std::get_if<KeyFileCredential>(&target.credential)) {
        if (key->path.empty())
            return Result<void>::Err(ErrorKind::CONFIG, "Key credential has no key path");
    }

    // The system ssh cannot be handed a password non-interactively
    if (backend == TransportBackend::EXEC_REPLACE &&
        std::holds_alternative<PasswordCredential>(target.credential)) {
        return Result<void>::Err(ErrorKind::CONFIG,
                                 "Password credentials are not supported by the exec backend; "
                                 "use a key or the agent");
    }
    return Result<void>::Ok();
}

Result<ConnectTarget> parse_target_spec(const std::string& spec) {
    using R = Result<ConnectTarget>;
    ConnectTarget target;
    std::string rest = spec;

    auto at = rest.rfind('@');
    if (at != std::string::npos) {
        target.username = rest.substr(0, at);
        rest = rest.substr(at + 1);
    } else {
        const char* user = std::getenv("USER");
        target.username = user ? user : "";
    }

    // Bracketed IPv6: [::1]:2222
    if (!rest.empty() && rest[0] == '[') {
        auto close = rest.find(']');
        if (close == std::string::npos)
            return R::Err(ErrorKind::CONFIG, fmt::format("Malformed target: {}", spec));
        target.host = rest.substr(1, close - 1);
        rest = rest.substr(close + 1);
        if (!rest.empty()) {
            if (rest[0] != ':')
                return R::Err(ErrorKind::CONFIG, fmt::format("Malformed target: {}", spec));
            rest = rest.substr(1);
            target.port = safe_stoi(rest, -1);
        }
    } else {
        auto colon = rest.find(':');
        if (colon != std::string::npos && rest.find(':', colon + 1) == std::string::npos) {
            target.host = rest.substr(0, colon);
            target.port = safe_stoi(rest.substr(colon + 1), -1);
        } else {
            target.host = rest;
        }
    }

    target.credential = AgentCredential{};

    auto valid = validate_target(target, TransportBackend::LIBRARY);
    if (valid.is_err()) return R::Err(valid.error);
    return R::Ok(target);
}
