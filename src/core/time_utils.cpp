#include "time_utils.hpp"
#include "utils.hpp"
#include <fmt/format.h>
#include <algorithm>
#include <ctime>

std::string format_duration(const std::string& start_time, const std::string& end_time) {
    if (start_time.empty()) return "-";

    std::time_t start_t = parse_iso_time(start_time);
    if (start_t == 0) return "?";

    std::time_t end_t;
    if (!end_time.empty()) {
        end_t = parse_iso_time(end_time);
        if (end_t == 0) return "?";
    } else {
        end_t = std::time(nullptr);
    }

    // Clock skew between writers; never show a negative duration
    int seconds = std::max(0, static_cast<int>(std::difftime(end_t, start_t)));
    int hours = seconds / 3600;
    int mins = (seconds % 3600) / 60;
    int secs = seconds % 60;

    if (hours > 0) {
        return fmt::format("{}h{}m", hours, mins);
    } else if (mins > 0) {
        return fmt::format("{}m{}s", mins, secs);
    } else {
        return fmt::format("{}s", secs);
    }
}
