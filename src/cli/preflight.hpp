#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include <core/config.hpp>
#include <core/types.hpp>

struct PreflightIssue {
    std::string message;
    std::string fix;
    bool is_hint = false;  // true = friendly nudge, false = error
};

// Runs the checks a command needs before it touches the cluster.
// Returns empty vector if everything is good (hints don't count as failures,
// see has_errors()).
std::vector<PreflightIssue> run_preflight_checks(const std::filesystem::path& config_path,
                                                 const Config& cfg, bool need_repositories,
                                                 bool need_cluster_tools = true);

// Individual checks (for granular use)
std::vector<PreflightIssue> check_config_file(const std::filesystem::path& config_path);
std::vector<PreflightIssue> check_paths(const Config& cfg);
std::vector<PreflightIssue> check_cluster_tooling(const ClusterConfig& cluster);

bool has_errors(const std::vector<PreflightIssue>& issues);
