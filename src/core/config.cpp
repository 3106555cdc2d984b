#include "config.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fstream>
#include <sstream>
#include <fmt/format.h>

namespace fs = std::filesystem;

fs::path get_config_dir() {
    return platform::home_dir() / ".rzterm";
}

fs::path get_config_path() {
    return get_config_dir() / "config.yaml";
}

bool config_exists() {
    return fs::exists(get_config_path());
}

const char* wait_strategy_name(WaitStrategy strategy) {
    return strategy == WaitStrategy::READINESS ? "readiness" : "busy_poll";
}

// Accepts either a scalar ("-y") or a sequence (["-y", "-b"]).
static std::vector<std::string> string_list(const YAML::Node& node,
                                            const std::vector<std::string>& fallback) {
    if (!node) return fallback;
    std::vector<std::string> out;
    if (node.IsScalar()) {
        out.push_back(node.as<std::string>());
    } else if (node.IsSequence()) {
        for (const auto& item : node) out.push_back(item.as<std::string>());
    } else if (!node.IsNull()) {
        throw std::runtime_error("expected a string or a list of strings");
    }
    return out;
}

static Settings parse_settings(const YAML::Node& node) {
    Settings s;
    if (!node) return s;
    if (!node.IsMap()) throw std::runtime_error("'settings' must be a map");

    s.poll_interval_ms = node["poll_interval_ms"].as<int>(s.poll_interval_ms);
    s.connect_timeout_secs = node["connect_timeout_secs"].as<int>(s.connect_timeout_secs);
    s.term = node["term"].as<std::string>(s.term);
    s.debug_log = node["debug_log"].as<std::string>(s.debug_log);

    std::string strategy = node["wait_strategy"].as<std::string>(wait_strategy_name(s.wait_strategy));
    if (strategy == "busy_poll") {
        s.wait_strategy = WaitStrategy::BUSY_POLL;
    } else if (strategy == "readiness") {
        s.wait_strategy = WaitStrategy::READINESS;
    } else {
        throw std::runtime_error(fmt::format("unknown wait_strategy '{}'", strategy));
    }

    s.send_helper = node["send_helper"].as<std::string>(s.send_helper);
    s.send_helper_args = string_list(node["send_helper_args"], s.send_helper_args);
    s.receive_helper = node["receive_helper"].as<std::string>(s.receive_helper);
    s.receive_helper_args = string_list(node["receive_helper_args"], s.receive_helper_args);
    s.upload_picker = node["upload_picker"].as<std::string>(s.upload_picker);
    s.download_dir = node["download_dir"].as<std::string>(s.download_dir);
    s.ssh_program = node["ssh_program"].as<std::string>(s.ssh_program);
    s.ssh_options = string_list(node["ssh_options"], s.ssh_options);

    if (s.poll_interval_ms < 1) s.poll_interval_ms = 1;
    if (s.connect_timeout_secs < 1)
        throw std::runtime_error("connect_timeout_secs must be positive");
    return s;
}

static HostEntry parse_host(const std::string& name, const YAML::Node& node) {
    if (!node.IsMap())
        throw std::runtime_error(fmt::format("host '{}' must be a map", name));

    HostEntry entry;
    entry.name = name;
    entry.target.host = node["host"].as<std::string>("");
    entry.target.port = node["port"].as<int>(22);
    entry.target.username = node["user"].as<std::string>("");
    entry.description = node["description"].as<std::string>("");

    std::string password = node["password"].as<std::string>("");
    std::string key = node["key"].as<std::string>("");

    // Infer the method when "auth" is omitted
    std::string auth = node["auth"].as<std::string>(
        !key.empty() ? "key" : (!password.empty() ? "password" : "agent"));

    if (auth == "password") {
        entry.target.credential = PasswordCredential{password};
    } else if (auth == "key") {
        KeyFileCredential cred;
        cred.path = key.empty() ? "~/.ssh/id_rsa" : key;
        if (!password.empty()) cred.fallback_secret = password;
        entry.target.credential = cred;
    } else if (auth == "agent") {
        entry.target.credential = AgentCredential{};
    } else {
        throw std::runtime_error(fmt::format("host '{}': unknown auth '{}'", name, auth));
    }

    auto backend = parse_backend(node["backend"].as<std::string>(""));
    if (backend.is_err())
        throw std::runtime_error(fmt::format("host '{}': {}", name, backend.error.message));
    entry.backend = backend.value;

    if (entry.target.host.empty())
        throw std::runtime_error(fmt::format("host '{}' has no 'host'", name));
    return entry;
}

Result<Config> Config::parse(const std::string& yaml_text) {
    try {
        YAML::Node root = YAML::Load(yaml_text);
        Config config;
        if (!root || root.IsNull()) return Result<Config>::Ok(config);
        if (!root.IsMap())
            return Result<Config>::Err(ErrorKind::CONFIG, "Config root must be a map");

        config.settings_ = parse_settings(root["settings"]);

        const YAML::Node hosts = root["hosts"];
        if (hosts) {
            if (!hosts.IsMap())
                return Result<Config>::Err(ErrorKind::CONFIG, "'hosts' must be a map");
            for (const auto& kv : hosts) {
                config.hosts_.push_back(parse_host(kv.first.as<std::string>(), kv.second));
            }
        }
        return Result<Config>::Ok(config);
    } catch (const std::exception& e) {
        return Result<Config>::Err(ErrorKind::CONFIG,
                                   std::string("Failed to parse config: ") + e.what());
    }
}

Result<Config> Config::load(const fs::path& path) {
    if (!fs::exists(path)) {
        return Result<Config>::Ok(Config{});
    }

    std::ifstream in(path);
    if (!in) {
        return Result<Config>::Err(ErrorKind::CONFIG,
                                   "Failed to read config file at " + path.string());
    }
    std::stringstream ss;
    ss << in.rdbuf();
    return parse(ss.str());
}

Result<Config> Config::load_default() {
    return load(get_config_path());
}

const HostEntry* Config::find_host(const std::string& name) const {
    for (const auto& h : hosts_) {
        if (h.name == name) return &h;
    }
    return nullptr;
}
