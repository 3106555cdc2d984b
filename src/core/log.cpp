#include "log.hpp"
#include <platform/platform.hpp>
#include <chrono>
#include <ctime>
#include <fstream>
#include <mutex>
#include <fmt/format.h>

static std::mutex g_log_mutex;

static std::string& log_path_ref() {
    static std::string path = (platform::temp_dir() / "rzterm_debug.log").string();
    return path;
}

std::string rzterm_log_path() {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    return log_path_ref();
}

void set_rzterm_log_path(const std::string& path) {
    if (path.empty()) return;
    std::lock_guard<std::mutex> lock(g_log_mutex);
    log_path_ref() = path;
}

void rzterm_log(const std::string& msg) {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);

    std::string line = fmt::format("[{:02d}:{:02d}:{:02d}.{:03d}] {}\n",
                                   tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
                                   static_cast<int>(ms.count()), msg);

    std::lock_guard<std::mutex> lock(g_log_mutex);
    std::ofstream out(log_path_ref(), std::ios::app);
    if (!out) return;
    out << line;
}

bool TraceSink::toggle() {
    bool now_on = !enabled_.load();
    enabled_.store(now_on);
    rzterm_log(now_on ? "trace enabled" : "trace disabled");
    return now_on;
}
