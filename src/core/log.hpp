#pragma once

#include <string>
#include <atomic>

// Debug log file: <tmp>/rzterm_debug.log unless overridden by settings.debug_log.
std::string rzterm_log_path();
void set_rzterm_log_path(const std::string& path);

// Append "[HH:MM:SS.mmm] msg" to the debug log. Never fails loudly.
void rzterm_log(const std::string& msg);

// Gated byte-accounting trace ("read 12 bytes from local", hex dumps).
// Off by default; Alt+D flips it at runtime, the debug backend starts it on.
class TraceSink {
public:
    explicit TraceSink(bool enabled = false) : enabled_(enabled) {}

    bool enabled() const { return enabled_.load(); }
    void enable(bool on) { enabled_.store(on); }

    // Flip and return the new state.
    bool toggle();

    void trace(const std::string& msg) const {
        if (enabled_.load()) rzterm_log(msg);
    }

private:
    std::atomic<bool> enabled_;
};
