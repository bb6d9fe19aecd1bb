#include "log.hpp"
#include "utils.hpp"
#include <core/constants.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <mutex>

namespace {

std::mutex g_log_mutex;
LogLevel g_threshold = LogLevel::Info;
bool g_echo_stderr = false;
std::string g_path;

const char* level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "debug";
        case LogLevel::Info:  return "info";
        case LogLevel::Warn:  return "warn";
        case LogLevel::Error: return "error";
    }
    return "info";
}

std::string default_log_path() {
    return (platform::temp_dir() / LOG_FILE_NAME).string();
}

std::string excerpt(const std::string& s) {
    if (s.size() <= static_cast<size_t>(LOG_OUTPUT_EXCERPT)) return s;
    return s.substr(0, LOG_OUTPUT_EXCERPT) +
           fmt::format("... ({} bytes total)", s.size());
}

} // namespace

LogLevel parse_log_level(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "debug") return LogLevel::Debug;
    if (lower == "warn" || lower == "warning") return LogLevel::Warn;
    if (lower == "error") return LogLevel::Error;
    return LogLevel::Info;
}

void log_init(const LoggingConfig& config) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_threshold = parse_log_level(config.level);
    g_echo_stderr = config.echo_stderr;
    g_path = config.file.empty() ? default_log_path() : config.file;

    std::error_code ec;
    std::filesystem::create_directories(std::filesystem::path(g_path).parent_path(), ec);
}

std::string log_path() {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    return g_path.empty() ? default_log_path() : g_path;
}

void daemon_log(LogLevel level, const std::string& msg) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    if (level < g_threshold) return;

    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);

    char ts[32];
    std::snprintf(ts, sizeof(ts), "%02d:%02d:%02d.%03d",
                  tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
                  static_cast<int>(ms.count()));
    std::string line = fmt::format("[{}] [{}] {}", ts, level_name(level), msg);

    if (g_path.empty()) g_path = default_log_path();
    std::ofstream out(g_path, std::ios::app);
    if (out) out << line << "\n";

    if (g_echo_stderr) std::cerr << line << "\n";
}

void log_process(const std::string& label, const std::vector<std::string>& argv,
                 const ProcessResult& r) {
    log_info(fmt::format("{} CMD: {}", label, join_args(argv)));
    auto level = r.success() ? LogLevel::Debug : LogLevel::Info;
    daemon_log(level, fmt::format("{} exit={} stdout({})={}", label, r.exit_code,
                                  r.stdout_data.size(), excerpt(r.stdout_data)));
    if (!r.stderr_data.empty())
        daemon_log(level, fmt::format("{} stderr={}", label, excerpt(r.stderr_data)));
}
