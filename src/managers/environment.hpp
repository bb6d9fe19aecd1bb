#pragma once

#include <map>
#include <optional>
#include <string>
#include "cluster_state_resolver.hpp"

// Declared cluster status, as recorded by this daemon. Distinct from the
// observed ClusterStatus the resolver reports.
enum class DeclaredClusterStatus { Running, Paused, Stopped };

// "running" | "paused" | "stopped"
inline const char* declared_status_name(DeclaredClusterStatus s) {
    switch (s) {
        case DeclaredClusterStatus::Running: return "running";
        case DeclaredClusterStatus::Paused:  return "paused";
        case DeclaredClusterStatus::Stopped: return "stopped";
    }
    return "stopped";
}

// Unknown names map to Stopped.
inline DeclaredClusterStatus parse_declared_status(const std::string& s) {
    if (s == "running") return DeclaredClusterStatus::Running;
    if (s == "paused") return DeclaredClusterStatus::Paused;
    return DeclaredClusterStatus::Stopped;
}

struct ClusterState {
    std::string name;
    std::string created_at;
    DeclaredClusterStatus status = DeclaredClusterStatus::Running;
    std::string kubeconfig_path;
    bool konflux_deployed = false;
};

struct RepositoryState {
    std::string name;
    std::string path;
    std::string current_branch;
    std::string last_synced;           // empty = never synced by this daemon
    int commits_behind_upstream = 0;
    bool has_local_changes = false;
};

struct MpcDeployment {
    std::string controller_image;
    std::string otp_image;
    std::string deployed_at;
    std::string source_git_hash;
};

struct FeatureState {
    bool aws_enabled = false;
    bool ibm_enabled = false;
    bool metrics_enabled = false;
};

// Aggregate root for one developer session.
struct DevEnvironment {
    std::string session_id;
    std::string created_at;
    std::string last_active;
    std::optional<ClusterState> cluster;
    std::map<std::string, RepositoryState> repositories;
    std::optional<MpcDeployment> mpc_deployment;
    FeatureState features;
    std::string operation_status = "idle";
    std::optional<std::string> last_operation_error;

    // Last observed status; Error until the first probe.
    ClusterStatus cluster_status = ClusterStatus::Error;
};
