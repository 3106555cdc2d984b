#include "rzterm_cli.hpp"
#include "theme.hpp"
#include <bridge/session_bridge.hpp>
#include <core/cancellation.hpp>
#include <core/constants.hpp>
#include <core/utils.hpp>
#include <ssh/delegated_session.hpp>
#include <ssh/transport_factory.hpp>
#include <boost/asio/io_context.hpp>
#include <iostream>
#include <fmt/format.h>

Result<CliOptions> parse_cli_options(const std::vector<std::string>& args) {
    CliOptions opts;
    for (size_t i = 0; i < args.size(); i++) {
        const std::string& a = args[i];
        if (!opts.target.empty()) {
            // Everything after the target belongs to the remote command
            opts.rest.push_back(a);
            continue;
        }
        if (a == "--backend" || a == "-b" || a == "-i") {
            if (i + 1 >= args.size()) {
                return Result<CliOptions>::Err(ErrorKind::CONFIG,
                                               fmt::format("{} needs a value", a));
            }
            if (a == "-i") opts.identity = args[++i];
            else opts.backend = args[++i];
        } else if (a == "--trace") {
            opts.trace = true;
        } else if (!a.empty() && a[0] == '-') {
            return Result<CliOptions>::Err(ErrorKind::CONFIG, "Unknown option: " + a);
        } else {
            opts.target = a;
        }
    }
    if (opts.target.empty()) {
        return Result<CliOptions>::Err(ErrorKind::CONFIG, "Missing target (host alias or user@host[:port])");
    }
    return Result<CliOptions>::Ok(opts);
}

RztermCLI::RztermCLI(Config config) : config_(std::move(config)) {}

Result<HostEntry> RztermCLI::resolve(const CliOptions& opts) const {
    HostEntry entry;
    if (const HostEntry* known = config_.find_host(opts.target)) {
        entry = *known;
    } else {
        auto parsed = parse_target_spec(opts.target);
        if (parsed.is_err()) return Result<HostEntry>::Err(parsed.error);
        entry.name = opts.target;
        entry.target = parsed.value;
    }

    if (!opts.identity.empty()) {
        KeyFileCredential key;
        key.path = expand_tilde(opts.identity);
        if (auto* pw = std::get_if<PasswordCredential>(&entry.target.credential)) {
            key.fallback_secret = pw->secret;
        }
        entry.target.credential = key;
    }

    if (!opts.backend.empty()) {
        auto backend = parse_backend(opts.backend);
        if (backend.is_err()) return Result<HostEntry>::Err(backend.error);
        entry.backend = backend.value;
    }

    auto valid = validate_target(entry.target, entry.backend);
    if (valid.is_err()) return Result<HostEntry>::Err(valid.error);
    return Result<HostEntry>::Ok(entry);
}

int RztermCLI::report(const SessionError& err) const {
    std::cout << theme::fail(describe(err));
    if (err.kind != ErrorKind::CANCELLED) {
        std::cout << theme::aside("debug log: " + rzterm_log_path());
    }
    return SessionBridge::exit_code_for(err);
}

// ── Commands ─────────────────────────────────────────────────

int RztermCLI::run_connect(const std::vector<std::string>& args) {
    auto opts = parse_cli_options(args);
    if (opts.is_err()) return report(opts.error);
    auto host = resolve(opts.value);
    if (host.is_err()) return report(host.error);

    const Settings& settings = config_.settings();
    const ConnectTarget& target = host.value.target;

    if (host.value.backend == TransportBackend::EXEC_REPLACE) {
        std::cout << theme::step("Handing over to " + settings.ssh_program);
        std::cout.flush();
        auto r = exec_system_ssh(target, settings);
        return report(r.error);   // only reached when exec failed
    }

    TraceSink trace(opts.value.trace || host.value.backend == TransportBackend::DEBUG);
    CancellationToken cancel;
    SignalCancellation signals(cancel);
    boost::asio::io_context ioc;

    std::cout << theme::step(fmt::format("Connecting to {} ({}, {})", target.display(),
                                         backend_name(host.value.backend),
                                         credential_name(target.credential)));
    std::cout.flush();

    SessionBridge bridge(make_transport(host.value.backend, settings, cancel, ioc),
                         settings, cancel, trace);
    bridge.set_async_context(&ioc);
    int code = bridge.run_interactive(target);

    const SessionError& err = bridge.last_error();
    if (err.kind != ErrorKind::NONE) {
        report(err);
    } else if (code == EXIT_CANCELLED) {
        std::cout << "\n" << theme::info("Session cancelled");
    } else if (code == 0) {
        std::cout << theme::ok(fmt::format("Connection to {} closed", target.host));
    } else {
        std::cout << theme::info(fmt::format("Connection to {} closed (remote status {})",
                                             target.host, code));
    }
    return code;
}

int RztermCLI::run_exec(const std::vector<std::string>& args) {
    auto opts = parse_cli_options(args);
    if (opts.is_err()) return report(opts.error);
    if (opts.value.rest.empty()) {
        return report(SessionError{ErrorKind::CONFIG, AuthReason::NONE, "Missing command"});
    }
    auto host = resolve(opts.value);
    if (host.is_err()) return report(host.error);

    std::string command = opts.value.rest[0];
    for (size_t i = 1; i < opts.value.rest.size(); i++) command += " " + opts.value.rest[i];

    const Settings& settings = config_.settings();
    const ConnectTarget& target = host.value.target;

    if (host.value.backend == TransportBackend::EXEC_REPLACE) {
        auto r = exec_system_ssh(target, settings, command);
        return report(r.error);
    }

    TraceSink trace(opts.value.trace || host.value.backend == TransportBackend::DEBUG);
    CancellationToken cancel;
    SignalCancellation signals(cancel);
    boost::asio::io_context ioc;

    SessionBridge bridge(make_transport(host.value.backend, settings, cancel, ioc),
                         settings, cancel, trace);
    bridge.set_async_context(&ioc);
    auto r = bridge.execute(target, command);
    if (r.is_err()) return report(r.error);

    std::cout << r.value.stdout_data;
    std::cerr << r.value.stderr_data;
    std::cout.flush();
    return r.value.exit_code >= 0 ? r.value.exit_code : EXIT_TRANSPORT_FAILURE;
}

int RztermCLI::run_hosts() const {
    std::cout << theme::section("Hosts");
    if (config_.hosts().empty()) {
        std::cout << theme::info("No hosts in " + get_config_path().string());
        return 0;
    }
    for (const auto& h : config_.hosts()) {
        std::string line = fmt::format("{}  {}  {}", h.target.display(), backend_name(h.backend),
                                       credential_name(h.target.credential));
        if (!h.description.empty()) line += "  " + theme::dim(h.description);
        std::cout << theme::kv(h.name, line);
    }
    std::cout << "\n";
    return 0;
}
