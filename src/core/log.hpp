#pragma once

#include <string>
#include <vector>
#include <core/types.hpp>

enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Error = 3 };

// "debug" | "info" | "warn" | "error" (case-insensitive); unknown → Info.
LogLevel parse_log_level(const std::string& name);

// Configure sink and threshold. Safe to call again (e.g. after config reload).
// Before the first call, lines go to temp_dir/mpcdev.log at Info.
void log_init(const LoggingConfig& config);

std::string log_path();

void daemon_log(LogLevel level, const std::string& msg);

inline void log_debug(const std::string& msg) { daemon_log(LogLevel::Debug, msg); }
inline void log_info(const std::string& msg)  { daemon_log(LogLevel::Info, msg); }
inline void log_warn(const std::string& msg)  { daemon_log(LogLevel::Warn, msg); }
inline void log_error(const std::string& msg) { daemon_log(LogLevel::Error, msg); }

// Log an external command and its captured output.
void log_process(const std::string& label, const std::vector<std::string>& argv,
                 const ProcessResult& r);
