#pragma once

#include <string>
#include <core/types.hpp>
#include <core/cancel_token.hpp>
#include "process_runner.hpp"
#include "cluster_state_resolver.hpp"

// Create / destroy / status for the one kind cluster named in ClusterConfig.
// Holds no state beyond what the cluster itself reports. Callers are
// responsible for never running create and destroy concurrently; the
// environment orchestrator does that through the operation tracker.
class ClusterManager {
public:
    ClusterManager(ProcessRunner& runner, ClusterConfig config);

    // kind create cluster. Success does not mean ready: poll status() or use
    // wait_until_running(). Err kind ClusterCreateFailed carries kind's full output.
    Result<void> create(const CancelToken& token);

    // kind delete cluster. Deleting a cluster that does not exist succeeds.
    Result<void> destroy(const CancelToken& token);

    // Never hangs past the token / probe timeout; tooling problems come back as Error.
    ClusterStatusReport status(const CancelToken& token);

    // Poll status() until Running. Fails when the token fires first.
    Result<void> wait_until_running(const CancelToken& token, int poll_interval_ms,
                                    StatusCallback cb = nullptr);

    // True if kind's stderr says there was nothing to delete.
    static bool is_not_found_message(const std::string& stderr_text, const std::string& cluster);

    const std::string& name() const { return config_.name; }
    const ClusterConfig& config() const { return config_; }

private:
    ProcessRunner& runner_;
    ClusterConfig config_;
    ClusterStateResolver resolver_;

    ProcessRequest kind_request(std::vector<std::string> args, const std::string& label) const;
};
