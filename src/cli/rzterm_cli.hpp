#pragma once

#include <string>
#include <vector>
#include <core/config.hpp>
#include <core/log.hpp>
#include <core/target.hpp>
#include <core/types.hpp>

// Command-line options shared by connect and exec.
struct CliOptions {
    std::string target;              // host alias or user@host[:port]
    std::string backend;             // empty: host entry / library
    std::string identity;            // -i key file
    bool trace = false;
    std::vector<std::string> rest;   // exec: the command words
};

// Parses "[--backend X] [-i key] [--trace] <target> [words...]".
Result<CliOptions> parse_cli_options(const std::vector<std::string>& args);

class RztermCLI {
public:
    explicit RztermCLI(Config config);

    int run_connect(const std::vector<std::string>& args);
    int run_exec(const std::vector<std::string>& args);
    int run_hosts() const;

    // Host alias from the config, else an ad-hoc user@host[:port].
    // Command-line overrides (-i, --backend) are applied on top.
    Result<HostEntry> resolve(const CliOptions& opts) const;

private:
    Config config_;

    int report(const SessionError& err) const;
};
