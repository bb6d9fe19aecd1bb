#include "preflight.hpp"
#include <platform/platform.hpp>
#include <fmt/format.h>

std::vector<PreflightIssue> check_config_file(const std::filesystem::path& config_path) {
    std::vector<PreflightIssue> issues;

    if (!config_exists(config_path)) {
        issues.push_back({
            "No config at " + config_path.string() + ", using defaults",
            "Run 'mpc-daemon init-config' to create one",
            true
        });
    }

    return issues;
}

std::vector<PreflightIssue> check_paths(const Config& cfg) {
    std::vector<PreflightIssue> issues;

    auto valid = cfg.validate();
    if (valid.is_err()) {
        issues.push_back({
            valid.error,
            "Set MPC_DEV_ENV_PATH / MPC_REPO_PATH, or paths: in the config file"
        });
    }

    return issues;
}

std::vector<PreflightIssue> check_cluster_tooling(const ClusterConfig& cluster) {
    std::vector<PreflightIssue> issues;

    if (platform::find_in_path(cluster.kind_binary).empty()) {
        issues.push_back({
            fmt::format("'{}' not found on PATH", cluster.kind_binary),
            "Install kind (https://kind.sigs.k8s.io) or set cluster.kind_binary"
        });
    }
    if (platform::find_in_path(cluster.kubectl_binary).empty()) {
        issues.push_back({
            fmt::format("'{}' not found on PATH", cluster.kubectl_binary),
            "Install kubectl or set cluster.kubectl_binary"
        });
    }
    if (!cluster.provider.empty() && platform::find_in_path(cluster.provider).empty()) {
        issues.push_back({
            fmt::format("Container provider '{}' not found on PATH", cluster.provider),
            "Install it, or set cluster.provider to docker",
            true
        });
    }
    if (!cluster.kind_config.empty() && !std::filesystem::exists(cluster.kind_config)) {
        issues.push_back({
            "kind config not found: " + cluster.kind_config,
            "Fix cluster.kind_config in the config file"
        });
    }

    return issues;
}

bool has_errors(const std::vector<PreflightIssue>& issues) {
    for (const auto& i : issues) {
        if (!i.is_hint) return true;
    }
    return false;
}

std::vector<PreflightIssue> run_preflight_checks(const std::filesystem::path& config_path,
                                                 const Config& cfg, bool need_repositories,
                                                 bool need_cluster_tools) {
    std::vector<PreflightIssue> all = check_config_file(config_path);

    if (need_repositories) {
        auto path_issues = check_paths(cfg);
        all.insert(all.end(), path_issues.begin(), path_issues.end());
    }

    if (need_cluster_tools) {
        auto tool_issues = check_cluster_tooling(cfg.cluster());
        all.insert(all.end(), tool_issues.begin(), tool_issues.end());
    }

    return all;
}
