#include "environment_json.hpp"

using nlohmann::json;

json to_json(const ClusterState& c) {
    return json{
        {"name", c.name},
        {"created_at", c.created_at},
        {"status", declared_status_name(c.status)},
        {"kubeconfig_path", c.kubeconfig_path},
        {"konflux_deployed", c.konflux_deployed},
    };
}

json to_json(const RepositoryState& r) {
    json j{
        {"name", r.name},
        {"path", r.path},
        {"current_branch", r.current_branch},
        {"commits_behind_upstream", r.commits_behind_upstream},
        {"has_local_changes", r.has_local_changes},
    };
    j["last_synced"] = r.last_synced.empty() ? json(nullptr) : json(r.last_synced);
    return j;
}

json to_json(const MpcDeployment& d) {
    return json{
        {"controller_image", d.controller_image},
        {"otp_image", d.otp_image},
        {"deployed_at", d.deployed_at},
        {"source_git_hash", d.source_git_hash},
    };
}

json to_json(const FeatureState& f) {
    return json{
        {"aws_enabled", f.aws_enabled},
        {"ibm_enabled", f.ibm_enabled},
        {"metrics_enabled", f.metrics_enabled},
    };
}

json to_json(const DevEnvironment& env) {
    json j;
    j["session_id"] = env.session_id;
    j["created_at"] = env.created_at;
    j["last_active"] = env.last_active;
    j["cluster"] = env.cluster ? to_json(*env.cluster) : json(nullptr);

    json repos = json::object();
    for (const auto& [name, repo] : env.repositories) {
        repos[name] = to_json(repo);
    }
    j["repositories"] = repos;

    j["mpc_deployment"] = env.mpc_deployment ? to_json(*env.mpc_deployment) : json(nullptr);
    j["features"] = to_json(env.features);
    j["operation_status"] = env.operation_status;
    j["last_operation_error"] = env.last_operation_error
        ? json(*env.last_operation_error) : json(nullptr);
    j["cluster_status"] = cluster_status_name(env.cluster_status);
    return j;
}

json operation_started_json(const std::string& op) {
    return json{{"status", "started"}, {"operation", op}};
}

json operation_error_json(ErrorKind kind, const std::string& message) {
    bool conflict = kind == ErrorKind::AlreadyRunning || kind == ErrorKind::OperationInProgress;
    return json{
        {"status", conflict ? "conflict" : "error"},
        {"error_kind", error_kind_name(kind)},
        {"error", message},
    };
}

json operation_reply_json(const std::string& op, const Result<void>& started) {
    if (started.is_ok()) return operation_started_json(op);
    return operation_error_json(started.kind, started.error);
}
