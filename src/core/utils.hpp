#pragma once

#include <string>
#include <vector>
#include <ctime>

// Generate an ISO 8601 UTC timestamp (YYYY-MM-DDTHH:MM:SSZ) for the current time.
std::string now_iso();

// Parse an ISO 8601 timestamp (with or without trailing Z) as UTC. Returns 0 on failure.
std::time_t parse_iso_time(const std::string& iso);

// Random RFC 4122 version-4 identifier, lowercase hex with dashes.
std::string generate_session_id();

// Safe integer parse: returns fallback on failure (no exceptions).
int safe_stoi(const std::string& s, int fallback = 0);

// Split text into lines, trimming each and dropping empty ones.
std::vector<std::string> split_lines(const std::string& text);

// Join argv-style tokens with single spaces (for logs and error messages).
std::string join_args(const std::vector<std::string>& args);

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}

inline std::string trimmed(std::string s) {
    trim(s);
    return s;
}
