#pragma once

#include <string>
#include <cstddef>

// Generate an ISO 8601 timestamp (YYYY-MM-DDTHH:MM:SS) for the current local time.
std::string now_iso();

// Safe integer parse: returns fallback on failure (no exceptions).
int safe_stoi(const std::string& s, int fallback = 0);

// Expand a leading "~" or "~/" to the home directory. Other paths unchanged.
std::string expand_tilde(const std::string& path);

// "1B 64 0D" style dump of at most max_bytes bytes.
std::string hex_bytes(const char* data, std::size_t len, std::size_t max_bytes = 50);

// "27 100 13" style decimal key codes, as typed.
std::string key_codes(const char* data, std::size_t len);

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}
