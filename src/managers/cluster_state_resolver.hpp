#pragma once

#include <string>
#include <core/types.hpp>
#include <core/cancel_token.hpp>
#include "process_runner.hpp"

// Observed cluster state, as opposed to the declared status kept in ClusterState.
enum class ClusterStatus {
    NotRunning,
    Initializing,   // registered with kind, control plane not serving yet
    Running,
    Error,          // the tooling itself is unusable; re-evaluated on every call
};

// "Not Running", "Initializing", "Running", "Error"
const char* cluster_status_name(ClusterStatus status);

struct ClusterStatusReport {
    ClusterStatus status = ClusterStatus::Error;
    std::string detail;   // diagnostic for Error, short explanation otherwise
};

// Classifies the cluster from two signals: registry membership
// (kind get clusters) and control-plane reachability (kubectl cluster-info).
// Registry absence short-circuits before the probe, since a probe against a
// missing cluster fails the same way a still-booting one does.
class ClusterStateResolver {
public:
    ClusterStateResolver(ProcessRunner& runner, const ClusterConfig& config);

    ClusterStatusReport resolve(const CancelToken& token);

    // True if `listing` (kind get clusters stdout) names `cluster` on a line of its own.
    static bool registry_contains(const std::string& listing, const std::string& cluster);

    ProcessRequest list_request() const;
    ProcessRequest probe_request() const;

private:
    ProcessRunner& runner_;
    const ClusterConfig& config_;
};
