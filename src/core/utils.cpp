#include "utils.hpp"
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <chrono>
#include <ctime>

std::string now_iso() {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm_buf);
    return std::string(buf);
}

int safe_stoi(const std::string& s, int fallback) {
    try {
        return std::stoi(s);
    } catch (const std::exception&) {
        return fallback;
    }
}

std::string expand_tilde(const std::string& path) {
    if (path.empty() || path[0] != '~') return path;
    if (path.size() == 1) return platform::home_dir().string();
    if (path[1] != '/') return path;  // ~user is not expanded
    return (platform::home_dir() / path.substr(2)).string();
}

std::string hex_bytes(const char* data, std::size_t len, std::size_t max_bytes) {
    std::string out;
    std::size_t n = len < max_bytes ? len : max_bytes;
    for (std::size_t i = 0; i < n; i++) {
        if (i) out += ' ';
        out += fmt::format("{:02X}", static_cast<unsigned char>(data[i]));
    }
    if (len > n) out += " ...";
    return out;
}

std::string key_codes(const char* data, std::size_t len) {
    std::string out;
    for (std::size_t i = 0; i < len; i++) {
        if (i) out += ' ';
        out += std::to_string(static_cast<unsigned char>(data[i]));
    }
    return out;
}
