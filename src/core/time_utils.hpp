#pragma once

#include <string>

// Elapsed time between two ISO timestamps as written by now_iso() (UTC).
// If end_time is empty, uses current time (for "still running" durations).
// Returns human-readable string like "2h35m", "14m22s", "8s", or "-" if start is empty.
std::string format_duration(const std::string& start_time, const std::string& end_time = "");
