#include "cluster_manager.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <chrono>

ClusterManager::ClusterManager(ProcessRunner& runner, ClusterConfig config)
    : runner_(runner), config_(std::move(config)), resolver_(runner_, config_) {
}

ProcessRequest ClusterManager::kind_request(std::vector<std::string> args,
                                            const std::string& label) const {
    ProcessRequest req;
    req.argv.push_back(config_.kind_binary);
    for (auto& a : args) req.argv.push_back(std::move(a));
    if (!config_.provider.empty()) {
        req.env["KIND_EXPERIMENTAL_PROVIDER"] = config_.provider;
    }
    req.label = label;
    return req;
}

bool ClusterManager::is_not_found_message(const std::string& stderr_text,
                                          const std::string& cluster) {
    for (const char* phrase : CLUSTER_NOT_FOUND_PHRASES) {
        std::string needle = fmt::format(fmt::runtime(phrase), cluster);
        if (stderr_text.find(needle) != std::string::npos) return true;
    }
    return false;
}

Result<void> ClusterManager::create(const CancelToken& token) {
    log_info(fmt::format("Creating kind cluster '{}'...", config_.name));

    std::vector<std::string> args = {"create", "cluster", "--name", config_.name};
    if (!config_.kind_config.empty()) {
        args.push_back("--config");
        args.push_back(config_.kind_config);
    }
    auto req = kind_request(std::move(args), "kind create cluster");
    req.combine_output = true;

    auto op_token = token.with_timeout(std::chrono::seconds(config_.create_timeout_secs));
    auto r = runner_.run(req, op_token);
    if (r.is_err()) {
        log_error(fmt::format("Cluster creation failed: {}", r.error));
        ErrorKind kind = (r.kind == ErrorKind::Canceled || r.kind == ErrorKind::TimedOut)
            ? r.kind : ErrorKind::ClusterCreateFailed;
        return Result<void>::Err(kind, "failed to create kind cluster: " + r.error);
    }
    if (r.value.failed()) {
        log_error(fmt::format("kind create cluster exited with {}", r.value.exit_code));
        return Result<void>::Err(ErrorKind::ClusterCreateFailed,
            fmt::format("failed to create kind cluster '{}' (exit {}); output:\n{}",
                        config_.name, r.value.exit_code, r.value.stdout_data));
    }

    log_info(fmt::format("Kind cluster '{}' created", config_.name));
    return Result<void>::Ok();
}

Result<void> ClusterManager::destroy(const CancelToken& token) {
    log_info(fmt::format("Destroying kind cluster '{}'...", config_.name));

    auto req = kind_request({"delete", "cluster", "--name", config_.name}, "kind delete cluster");
    auto op_token = token.with_timeout(std::chrono::seconds(config_.destroy_timeout_secs));
    auto r = runner_.run(req, op_token);
    if (r.is_err()) {
        log_error(fmt::format("Cluster deletion failed: {}", r.error));
        ErrorKind kind = (r.kind == ErrorKind::Canceled || r.kind == ErrorKind::TimedOut)
            ? r.kind : ErrorKind::ClusterDestroyFailed;
        return Result<void>::Err(kind, "failed to delete kind cluster: " + r.error);
    }

    if (r.value.failed()) {
        if (is_not_found_message(r.value.stderr_data, config_.name)) {
            log_info("Cluster does not exist (already deleted or never created)");
            return Result<void>::Ok();
        }
        log_error(fmt::format("kind delete cluster exited with {}", r.value.exit_code));
        return Result<void>::Err(ErrorKind::ClusterDestroyFailed,
            fmt::format("failed to delete kind cluster '{}' (exit {}); stderr:\n{}",
                        config_.name, r.value.exit_code, r.value.stderr_data));
    }

    log_info(fmt::format("Kind cluster '{}' destroyed", config_.name));
    return Result<void>::Ok();
}

ClusterStatusReport ClusterManager::status(const CancelToken& token) {
    log_debug(fmt::format("Checking kind cluster '{}' status...", config_.name));
    return resolver_.resolve(token);
}

Result<void> ClusterManager::wait_until_running(const CancelToken& token, int poll_interval_ms,
                                                StatusCallback cb) {
    ClusterStatus last = ClusterStatus::Error;
    bool first = true;

    while (true) {
        auto report = status(token);
        if (first || report.status != last) {
            if (cb) cb(fmt::format("Cluster '{}': {}", config_.name,
                                   cluster_status_name(report.status)));
            last = report.status;
            first = false;
        }
        if (report.status == ClusterStatus::Running) return Result<void>::Ok();

        // Sleep in small slices so cancellation is noticed promptly.
        int slept = 0;
        while (slept < poll_interval_ms && !token.should_stop()) {
            int slice = std::min(100, poll_interval_ms - slept);
            platform::sleep_ms(slice);
            slept += slice;
        }
        if (token.cancelled()) {
            return Result<void>::Err(ErrorKind::Canceled,
                fmt::format("wait for cluster '{}' canceled", config_.name));
        }
        if (token.expired()) {
            return Result<void>::Err(ErrorKind::TimedOut,
                fmt::format("cluster '{}' not running before deadline (last state: {}; {})",
                            config_.name, cluster_status_name(last), report.detail));
        }
    }
}
