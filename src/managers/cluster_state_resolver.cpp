#include "cluster_state_resolver.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <chrono>

const char* cluster_status_name(ClusterStatus status) {
    switch (status) {
        case ClusterStatus::NotRunning:   return "Not Running";
        case ClusterStatus::Initializing: return "Initializing";
        case ClusterStatus::Running:      return "Running";
        case ClusterStatus::Error:        return "Error";
    }
    return "Error";
}

ClusterStateResolver::ClusterStateResolver(ProcessRunner& runner, const ClusterConfig& config)
    : runner_(runner), config_(config) {
}

bool ClusterStateResolver::registry_contains(const std::string& listing,
                                             const std::string& cluster) {
    for (const auto& line : split_lines(listing)) {
        if (line == cluster) return true;
    }
    return false;
}

ProcessRequest ClusterStateResolver::list_request() const {
    ProcessRequest req;
    req.argv = {config_.kind_binary, "get", "clusters"};
    if (!config_.provider.empty()) {
        req.env["KIND_EXPERIMENTAL_PROVIDER"] = config_.provider;
    }
    req.label = "kind get clusters";
    req.term_grace_ms = 0;
    return req;
}

ProcessRequest ClusterStateResolver::probe_request() const {
    ProcessRequest req;
    req.argv = {config_.kubectl_binary, "cluster-info", "--context", "kind-" + config_.name};
    if (!config_.kubeconfig_path.empty()) {
        req.argv.push_back("--kubeconfig");
        req.argv.push_back(config_.kubeconfig_path);
    }
    req.combine_output = true;
    req.label = "kubectl cluster-info";
    req.term_grace_ms = 0;
    return req;
}

ClusterStatusReport ClusterStateResolver::resolve(const CancelToken& token) {
    // Both reads share one probe_timeout budget. Their requests carry no
    // SIGTERM grace, so a child that ignores SIGTERM cannot stretch it.
    auto bounded = token.with_timeout(std::chrono::seconds(config_.probe_timeout_secs));

    // 1. Registry membership
    auto listed = runner_.run(list_request(), bounded);
    if (listed.is_err()) {
        log_warn(fmt::format("Failed to list kind clusters: {}", listed.error));
        return {ClusterStatus::Error, "failed to list clusters: " + listed.error};
    }
    if (listed.value.failed()) {
        std::string diag = trimmed(listed.value.combined_output());
        log_warn(fmt::format("kind get clusters exited with {}", listed.value.exit_code));
        return {ClusterStatus::Error,
                fmt::format("kind get clusters exited with {}: {}", listed.value.exit_code, diag)};
    }

    // 2. Absent → not running; never probe a cluster that isn't registered
    if (trimmed(listed.value.stdout_data).empty()) {
        log_debug("No kind clusters found");
        return {ClusterStatus::NotRunning, "no kind clusters found"};
    }
    if (!registry_contains(listed.value.stdout_data, config_.name)) {
        log_debug(fmt::format("Cluster '{}' not found", config_.name));
        return {ClusterStatus::NotRunning, fmt::format("cluster '{}' not found", config_.name)};
    }

    // 3. Registered → is the control plane serving?
    auto probe = runner_.run(probe_request(), bounded);
    if (probe.is_err() && probe.kind == ErrorKind::Canceled) {
        return {ClusterStatus::Error, "status check canceled: " + probe.error};
    }
    if (probe.is_err() || probe.value.failed()) {
        log_info(fmt::format("Cluster '{}' exists but is not reachable yet (still initializing)",
                             config_.name));
        std::string why = probe.is_err() ? probe.error : trimmed(probe.value.combined_output());
        return {ClusterStatus::Initializing, why};
    }

    // 4. Reachable
    log_debug(fmt::format("Cluster '{}' is running and reachable", config_.name));
    return {ClusterStatus::Running, fmt::format("cluster '{}' is reachable", config_.name)};
}
