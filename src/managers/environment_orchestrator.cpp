#include "environment_orchestrator.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <system_error>

EnvironmentOrchestrator::EnvironmentOrchestrator(ClusterManager& cluster, StateStore* store,
                                                 RepositoryInspector* inspector,
                                                 OrchestratorOptions options)
    : cluster_(cluster), store_(store), inspector_(inspector), options_(std::move(options)) {
    load_session();
}

EnvironmentOrchestrator::~EnvironmentOrchestrator() {
    shutdown();
}

void EnvironmentOrchestrator::load_session() {
    std::lock_guard<std::mutex> lock(env_mutex_);

    std::optional<SessionRecord> rec;
    if (store_) rec = store_->load();

    if (rec) {
        env_.session_id = rec->session_id;
        env_.created_at = rec->created_at;
        env_.cluster = rec->cluster;
        env_.mpc_deployment = rec->mpc_deployment;
        env_.features = rec->features;
        log_info(fmt::format("Resumed session {}", env_.session_id));
    } else {
        env_.session_id = generate_session_id();
        env_.created_at = now_iso();
        log_info(fmt::format("Started new session {}", env_.session_id));
    }
    env_.last_active = now_iso();
    persist_locked();
}

void EnvironmentOrchestrator::persist_locked() {
    if (!store_) return;

    SessionRecord rec;
    rec.session_id = env_.session_id;
    rec.created_at = env_.created_at;
    rec.cluster = env_.cluster;
    rec.mpc_deployment = env_.mpc_deployment;
    rec.features = env_.features;

    auto saved = store_->save(rec);
    if (saved.is_err()) {
        log_warn(fmt::format("Failed to persist session: {}", saved.error));
    }
}

ClusterState EnvironmentOrchestrator::new_cluster_record() const {
    ClusterState c;
    c.name = cluster_.name();
    c.created_at = now_iso();
    c.status = DeclaredClusterStatus::Running;
    c.kubeconfig_path = cluster_.config().kubeconfig_path;
    return c;
}

void EnvironmentOrchestrator::reconcile_cluster_locked(const ClusterStatusReport& observed) {
    env_.cluster_status = observed.status;

    switch (observed.status) {
        case ClusterStatus::Running:
        case ClusterStatus::Initializing:
            if (!env_.cluster) {
                log_info(fmt::format("Adopting existing cluster '{}'", cluster_.name()));
                env_.cluster = new_cluster_record();
            } else if (env_.cluster->status == DeclaredClusterStatus::Stopped) {
                env_.cluster->status = DeclaredClusterStatus::Running;
            }
            break;
        case ClusterStatus::NotRunning:
            if (env_.cluster && env_.cluster->status != DeclaredClusterStatus::Stopped) {
                log_info(fmt::format("Cluster '{}' is gone, marking stopped", cluster_.name()));
                env_.cluster->status = DeclaredClusterStatus::Stopped;
            }
            break;
        case ClusterStatus::Error:
            // Tooling problem; the record is neither confirmed nor refuted.
            break;
    }
}

DevEnvironment EnvironmentOrchestrator::snapshot_locked() const {
    DevEnvironment copy = env_;
    auto op = tracker_.current_status();
    copy.operation_status = op.status;
    copy.last_operation_error = op.last_error;
    return copy;
}

bool EnvironmentOrchestrator::cluster_op_running() const {
    auto op = tracker_.current_status().status;
    return op == OP_CREATING_CLUSTER || op == OP_DESTROYING_CLUSTER;
}

DevEnvironment EnvironmentOrchestrator::get_status() {
    uint64_t generation;
    {
        std::lock_guard<std::mutex> lock(env_mutex_);
        generation = cluster_generation_;
    }

    // External calls happen without the aggregate lock.
    auto probe_token = root_token_.with_timeout(std::chrono::seconds(options_.probe_timeout_secs));
    ClusterStatusReport observed = cluster_.status(probe_token);

    std::map<std::string, RepositoryState> repos;
    if (inspector_) {
        for (const auto& [name, path] : options_.repositories) {
            auto t = root_token_.with_timeout(std::chrono::seconds(options_.probe_timeout_secs));
            auto r = inspector_->inspect(name, path, t);
            if (r.is_err()) {
                log_warn(fmt::format("Skipping repository {}: {}", name, r.error));
                continue;
            }
            repos[name] = r.value;
        }
    }

    std::lock_guard<std::mutex> lock(env_mutex_);
    if (generation != cluster_generation_ || cluster_op_running()) {
        log_debug("Cluster changed during status probe, keeping the newer record");
    } else {
        reconcile_cluster_locked(observed);
    }
    for (auto& [name, repo] : repos) {
        auto it = last_synced_.find(name);
        if (it != last_synced_.end()) repo.last_synced = it->second;
    }
    env_.repositories = std::move(repos);
    env_.last_active = now_iso();
    persist_locked();
    return snapshot_locked();
}

DevEnvironment EnvironmentOrchestrator::snapshot() const {
    std::lock_guard<std::mutex> lock(env_mutex_);
    return snapshot_locked();
}

void EnvironmentOrchestrator::update(const EnvironmentMutator& mutate) {
    std::lock_guard<std::mutex> lock(env_mutex_);
    mutate(env_);
    env_.last_active = now_iso();
    persist_locked();
}

Result<void> EnvironmentOrchestrator::start_operation(const std::string& op, OperationWork work,
                                                      EnvironmentMutator on_success,
                                                      int timeout_secs) {
    if (!work) {
        return Result<void>::Err(ErrorKind::InvalidArgument,
                                 fmt::format("operation '{}' has no work", op));
    }

    auto begun = tracker_.begin(op);
    if (begun.is_err()) return begun;

    reap_workers();

    int secs = timeout_secs > 0 ? timeout_secs : options_.operation_timeout_secs;
    CancelToken token = root_token_.with_timeout(std::chrono::seconds(secs));
    auto done = std::make_shared<std::atomic<bool>>(false);

    std::lock_guard<std::mutex> lock(workers_mutex_);
    if (shut_down_) {
        finish(op, std::string("daemon is shutting down"));
        return Result<void>::Err(ErrorKind::Canceled, "daemon is shutting down");
    }
    try {
        std::thread t([this, op, work = std::move(work), on_success = std::move(on_success),
                       token, done]() {
            run_operation(op, work, on_success, token);
            done->store(true);
        });
        workers_.push_back({std::move(t), done});
    } catch (const std::system_error& e) {
        finish(op, std::string("failed to start worker thread: ") + e.what());
        return Result<void>::Err(ErrorKind::OperationFailed,
            fmt::format("failed to start '{}': {}", op, e.what()));
    }
    return Result<void>::Ok();
}

void EnvironmentOrchestrator::run_operation(const std::string& op, const OperationWork& work,
                                            const EnvironmentMutator& on_success,
                                            const CancelToken& token) {
    std::optional<std::string> error;

    try {
        auto r = work(token);
        if (r.is_err()) {
            error = r.error.empty() ? std::string(error_kind_name(r.kind)) : r.error;
        } else if (on_success) {
            std::lock_guard<std::mutex> lock(env_mutex_);
            on_success(env_);
            env_.last_active = now_iso();
            persist_locked();
        }
    } catch (const std::exception& e) {
        error = fmt::format("{} failed unexpectedly: {}", op, e.what());
    } catch (...) {
        error = fmt::format("{} failed with an unknown exception", op);
    }

    finish(op, error);
}

void EnvironmentOrchestrator::finish(const std::string& op,
                                     const std::optional<std::string>& error) {
    auto done = tracker_.complete(op, error);
    if (done.is_err()) {
        log_error(fmt::format("Operation bookkeeping error: {}", done.error));
    }
    std::lock_guard<std::mutex> lock(idle_mutex_);
    idle_cv_.notify_all();
}

void EnvironmentOrchestrator::reap_workers() {
    std::lock_guard<std::mutex> lock(workers_mutex_);
    for (auto it = workers_.begin(); it != workers_.end();) {
        if (it->done->load()) {
            if (it->thread.joinable()) it->thread.join();
            it = workers_.erase(it);
        } else {
            ++it;
        }
    }
}

// Runs `body` on the caller's thread inside an already-begun tracker slot.
// finish() runs exactly once, also when body throws.
Result<void> EnvironmentOrchestrator::run_tracked(const std::string& op,
                                                  const std::function<Result<void>()>& body) {
    Result<void> result = Result<void>::Ok();
    try {
        result = body();
    } catch (const std::exception& e) {
        result = Result<void>::Err(fmt::format("{} failed unexpectedly: {}", op, e.what()));
    } catch (...) {
        result = Result<void>::Err(fmt::format("{} failed with an unknown exception", op));
    }

    finish(op, result.is_err() ? std::optional<std::string>(result.error) : std::nullopt);
    return result;
}

Result<void> EnvironmentOrchestrator::create_cluster(const CancelToken& token) {
    auto begun = tracker_.begin(OP_CREATING_CLUSTER);
    if (begun.is_err()) return begun;

    return run_tracked(OP_CREATING_CLUSTER, [&]() {
        auto created = cluster_.create(token);
        if (created.is_ok()) {
            std::lock_guard<std::mutex> lock(env_mutex_);
            env_.cluster = new_cluster_record();
            cluster_generation_++;
            env_.last_active = now_iso();
            persist_locked();
        }
        return created;
    });
}

Result<void> EnvironmentOrchestrator::start_cluster_creation() {
    return start_operation(
        OP_CREATING_CLUSTER,
        [this](const CancelToken& token) { return cluster_.create(token); },
        [this](DevEnvironment& env) {
            env.cluster = new_cluster_record();
            cluster_generation_++;
        },
        cluster_.config().create_timeout_secs);
}

Result<void> EnvironmentOrchestrator::destroy_environment(const CancelToken& token) {
    auto begun = tracker_.begin(OP_DESTROYING_CLUSTER);
    if (begun.is_err()) {
        if (begun.kind == ErrorKind::AlreadyRunning) {
            return Result<void>::Err(ErrorKind::OperationInProgress,
                "cannot destroy environment: " + begun.error);
        }
        return begun;
    }

    return run_tracked(OP_DESTROYING_CLUSTER, [&]() {
        auto destroyed = cluster_.destroy(token);
        if (destroyed.is_ok()) {
            std::lock_guard<std::mutex> lock(env_mutex_);
            env_.cluster.reset();
            env_.mpc_deployment.reset();
            env_.cluster_status = ClusterStatus::NotRunning;
            cluster_generation_++;
            env_.last_active = now_iso();
            persist_locked();
        }
        return destroyed;
    });
}

Result<void> EnvironmentOrchestrator::start_repository_sync() {
    if (!inspector_ || options_.repositories.empty()) {
        return Result<void>::Err(ErrorKind::InvalidArgument, "no repositories to sync");
    }

    return start_operation(OP_SYNCING_REPOS, [this](const CancelToken& token) {
        std::vector<std::string> failures;
        for (const auto& [name, path] : options_.repositories) {
            auto r = inspector_->sync(path, token);
            if (r.is_err()) {
                failures.push_back(fmt::format("{}: {}", name, r.error));
                if (r.kind == ErrorKind::Canceled) break;
                continue;
            }
            std::lock_guard<std::mutex> lock(env_mutex_);
            last_synced_[name] = now_iso();
            auto it = env_.repositories.find(name);
            if (it != env_.repositories.end()) it->second.last_synced = last_synced_[name];
        }
        if (!failures.empty()) {
            std::string msg = "repository sync failed";
            for (const auto& f : failures) msg += "\n  " + f;
            return Result<void>::Err(msg);
        }
        return Result<void>::Ok();
    });
}

bool EnvironmentOrchestrator::wait_for_idle(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(idle_mutex_);
    return idle_cv_.wait_for(lock, timeout, [this] { return tracker_.idle(); });
}

void EnvironmentOrchestrator::shutdown() {
    std::vector<Worker> workers;
    {
        std::lock_guard<std::mutex> lock(workers_mutex_);
        if (shut_down_ && workers_.empty()) return;
        shut_down_ = true;
        workers.swap(workers_);
    }

    if (!workers.empty()) {
        log_info(fmt::format("Shutting down: canceling {} worker(s)", workers.size()));
    }
    root_token_.cancel();
    for (auto& w : workers) {
        if (w.thread.joinable()) w.thread.join();
    }
}
