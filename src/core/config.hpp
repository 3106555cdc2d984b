#pragma once

#include <string>
#include <vector>
#include <optional>
#include <filesystem>
#include "types.hpp"
#include "target.hpp"

namespace fs = std::filesystem;

enum class WaitStrategy {
    BUSY_POLL,   // sleep poll_interval_ms between iterations
    READINESS,   // poll() on stdin + the channel socket
};

struct Settings {
    int poll_interval_ms = 5;
    WaitStrategy wait_strategy = WaitStrategy::BUSY_POLL;
    int connect_timeout_secs = 30;
    std::string term = "xterm-256color";
    std::string debug_log;                       // empty: <tmp>/rzterm_debug.log

    // Transfer helpers (lrzsz)
    std::string send_helper = "sz";
    std::vector<std::string> send_helper_args;
    std::string receive_helper = "rz";
    std::vector<std::string> receive_helper_args{"-y"};
    std::string upload_picker;                   // e.g. "zenity --file-selection"
    std::string download_dir;                    // empty: current directory

    // Delegated mode
    std::string ssh_program = "ssh";
    std::vector<std::string> ssh_options{
        "StrictHostKeyChecking=no",
        "HashKnownHosts=no",
        "ServerAliveInterval=60",
    };
};

struct HostEntry {
    std::string name;
    ConnectTarget target;
    TransportBackend backend = TransportBackend::LIBRARY;
    std::string description;
};

const char* wait_strategy_name(WaitStrategy strategy);

class Config {
public:
    // Load ~/.rzterm/config.yaml. A missing file yields the defaults.
    static Result<Config> load_default();

    // Load a specific file. Missing file: defaults. Malformed: CONFIG error.
    static Result<Config> load(const fs::path& path);

    // Parse YAML text (used by load and by tests).
    static Result<Config> parse(const std::string& yaml_text);

    const Settings& settings() const { return settings_; }
    const std::vector<HostEntry>& hosts() const { return hosts_; }
    const HostEntry* find_host(const std::string& name) const;

    Config() = default;

private:
    Settings settings_;
    std::vector<HostEntry> hosts_;
};

fs::path get_config_dir();
fs::path get_config_path();
bool config_exists();
