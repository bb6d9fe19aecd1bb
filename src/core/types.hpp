#pragma once

#include <string>
#include <optional>
#include <vector>
#include <map>
#include <functional>
#include <cstdint>

// Failure categories carried alongside every error message.
enum class ErrorKind {
    None,
    InvalidArgument,
    ConfigError,
    ToolUnavailable,        // process could not be started at all
    Canceled,
    TimedOut,
    ClusterCreateFailed,
    ClusterDestroyFailed,
    AlreadyRunning,         // operation gate refused a second operation
    OperationInProgress,    // destroy requested while an operation runs
    OperationFailed,
};

// Stable snake_case names used on the client-facing JSON.
inline const char* error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::None:                 return "none";
        case ErrorKind::InvalidArgument:      return "invalid_argument";
        case ErrorKind::ConfigError:          return "config_error";
        case ErrorKind::ToolUnavailable:      return "tool_unavailable";
        case ErrorKind::Canceled:             return "canceled";
        case ErrorKind::TimedOut:             return "timed_out";
        case ErrorKind::ClusterCreateFailed:  return "cluster_create_failed";
        case ErrorKind::ClusterDestroyFailed: return "cluster_destroy_failed";
        case ErrorKind::AlreadyRunning:       return "already_running";
        case ErrorKind::OperationInProgress:  return "operation_in_progress";
        case ErrorKind::OperationFailed:      return "operation_failed";
    }
    return "unknown";
}

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;
    ErrorKind kind = ErrorKind::None;

    static Result<T> Ok(T val) {
        return {true, std::move(val), "", ErrorKind::None};
    }

    static Result<T> Err(const std::string& err) {
        return {false, T{}, err, ErrorKind::OperationFailed};
    }

    static Result<T> Err(ErrorKind kind, const std::string& err) {
        return {false, T{}, err, kind};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;
    ErrorKind kind = ErrorKind::None;

    static Result<void> Ok() {
        return {true, "", ErrorKind::None};
    }

    static Result<void> Err(const std::string& err) {
        return {false, err, ErrorKind::OperationFailed};
    }

    static Result<void> Err(ErrorKind kind, const std::string& err) {
        return {false, err, kind};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Captured outcome of an external command. A non-zero exit is data, not an error.
struct ProcessResult {
    int exit_code = -1;
    std::string stdout_data;
    std::string stderr_data;

    bool success() const { return exit_code == 0; }
    bool failed() const { return exit_code != 0; }

    std::string combined_output() const {
        if (stderr_data.empty()) return stdout_data;
        if (stdout_data.empty()) return stderr_data;
        std::string out = stdout_data;
        if (out.back() != '\n') out += '\n';
        return out + stderr_data;
    }
};

// Configuration structures
struct ClusterConfig {
    std::string name = "konflux";
    std::string provider = "podman";          // KIND_EXPERIMENTAL_PROVIDER
    std::string kind_binary = "kind";
    std::string kubectl_binary = "kubectl";
    std::string kind_config;                  // optional kind-config.yaml
    std::string kubeconfig_path;              // owned by kind, read-only here
    int create_timeout_secs = 600;
    int destroy_timeout_secs = 300;
    int probe_timeout_secs = 10;
};

struct LoggingConfig {
    std::string level = "info";
    std::string file;                         // empty = temp_dir/mpcdev.log
    bool echo_stderr = false;
};

struct OperationConfig {
    std::vector<std::string> command;
    std::string working_dir;
    std::map<std::string, std::string> environment;
    int timeout_secs = 900;
};

struct DeploymentConfig {
    std::string controller_image = "localhost/multi-platform-controller:latest";
    std::string otp_image = "localhost/multi-platform-otp:latest";
};

// Status callback for operations
using StatusCallback = std::function<void(const std::string&)>;
