#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include <core/types.hpp>
#include <core/cancel_token.hpp>
#include <core/constants.hpp>
#include "cluster_manager.hpp"
#include "environment.hpp"
#include "git_inspector.hpp"
#include "operation_tracker.hpp"
#include "state_store.hpp"

struct OrchestratorOptions {
    std::map<std::string, std::string> repositories;   // name → path
    int probe_timeout_secs = STATUS_PROBE_TIMEOUT_SECS;
    int operation_timeout_secs = OPERATION_TIMEOUT_SECS;
};

// Work run on its own thread for a tracked operation.
using OperationWork = std::function<Result<void>(const CancelToken&)>;

// Applied to the aggregate, under its lock, after the work succeeded.
using EnvironmentMutator = std::function<void(DevEnvironment&)>;

// Owns the DevEnvironment aggregate for one session and binds the cluster
// manager and the operation tracker to it. Status reads never wait on a
// running operation; every mutation of the cluster goes through the
// tracker's single slot.
class EnvironmentOrchestrator {
public:
    // store and inspector are optional (nullptr = in-memory session, no repositories).
    EnvironmentOrchestrator(ClusterManager& cluster, StateStore* store,
                            RepositoryInspector* inspector, OrchestratorOptions options);
    ~EnvironmentOrchestrator();

    EnvironmentOrchestrator(const EnvironmentOrchestrator&) = delete;
    EnvironmentOrchestrator& operator=(const EnvironmentOrchestrator&) = delete;

    // Probe the cluster and repositories, merge, return a snapshot. Always succeeds.
    DevEnvironment get_status();

    // Last merged state plus live operation fields. No external calls.
    DevEnvironment snapshot() const;

    // Returns as soon as the work is launched. AlreadyRunning if the slot is taken.
    // timeout_secs <= 0 uses the configured operation timeout.
    Result<void> start_operation(const std::string& op, OperationWork work,
                                 EnvironmentMutator on_success = nullptr,
                                 int timeout_secs = 0);

    // Tracked as creating_cluster. Does not wait for readiness.
    Result<void> create_cluster(const CancelToken& token);
    Result<void> start_cluster_creation();

    // Only when idle; OperationInProgress otherwise. Tracked as destroying_cluster.
    Result<void> destroy_environment(const CancelToken& token);

    // Fetch upstream for every tracked repository, as syncing_repositories.
    Result<void> start_repository_sync();

    // Apply a mutation to the aggregate and persist it.
    void update(const EnvironmentMutator& mutate);

    // False if the timeout passed with an operation still running.
    bool wait_for_idle(std::chrono::milliseconds timeout);

    // Cancel running work and join its threads. Idempotent.
    void shutdown();

    OperationSnapshot operation_status() const { return tracker_.current_status(); }

    ClusterManager& cluster() { return cluster_; }
    RepositoryInspector* inspector() { return inspector_; }
    const OrchestratorOptions& options() const { return options_; }

private:
    struct Worker {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    ClusterManager& cluster_;
    StateStore* store_;
    RepositoryInspector* inspector_;
    OrchestratorOptions options_;

    OperationTracker tracker_;
    CancelToken root_token_;

    mutable std::mutex env_mutex_;
    DevEnvironment env_;
    std::map<std::string, std::string> last_synced_;   // repo name → ISO time
    // Bumped whenever create/destroy changes the cluster record. A probe
    // taken under an older generation is not merged.
    uint64_t cluster_generation_ = 0;

    std::mutex workers_mutex_;
    std::vector<Worker> workers_;
    bool shut_down_ = false;

    std::mutex idle_mutex_;
    std::condition_variable idle_cv_;

    void load_session();
    void persist_locked();
    void reconcile_cluster_locked(const ClusterStatusReport& observed);
    ClusterState new_cluster_record() const;
    DevEnvironment snapshot_locked() const;

    void run_operation(const std::string& op, const OperationWork& work,
                       const EnvironmentMutator& on_success, const CancelToken& token);
    void finish(const std::string& op, const std::optional<std::string>& error);
    Result<void> run_tracked(const std::string& op, const std::function<Result<void>()>& body);
    bool cluster_op_running() const;
    void reap_workers();
};
