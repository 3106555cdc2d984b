#include "delegated_session.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <platform/process.hpp>
#include <fmt/format.h>

std::vector<std::string> build_ssh_argv(const ConnectTarget& target,
                                        const Settings& settings,
                                        const std::string& command) {
    std::vector<std::string> args;

    if (target.port != 22) {
        args.push_back("-p");
        args.push_back(std::to_string(target.port));
    }
    if (auto* key = std::get_if<KeyFileCredential>(&target.credential)) {
        args.push_back("-i");
        args.push_back(expand_tilde(key->path));
    }
    for (const auto& opt : settings.ssh_options) {
        args.push_back("-o");
        args.push_back(opt);
    }
    // Interactive commands still want a terminal
    if (!command.empty()) args.push_back("-t");

    args.push_back(target.username + "@" + target.host);
    if (!command.empty()) args.push_back(command);
    return args;
}

Result<void> exec_system_ssh(const ConnectTarget& target,
                             const Settings& settings,
                             const std::string& command) {
    auto valid = validate_target(target, TransportBackend::EXEC_REPLACE);
    if (valid.is_err()) return valid;

    auto args = build_ssh_argv(target, settings, command);
    std::string line = settings.ssh_program;
    for (const auto& a : args) line += " " + a;
    rzterm_log("exec: " + line);

    return platform::exec_replace(settings.ssh_program, args);
}
