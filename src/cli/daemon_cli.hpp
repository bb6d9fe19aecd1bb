#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <core/config.hpp>
#include <managers/process_runner.hpp>
#include <managers/cluster_manager.hpp>
#include <managers/state_store.hpp>
#include <managers/git_inspector.hpp>
#include <managers/environment_orchestrator.hpp>
#include <managers/operation_catalog.hpp>

// Command-line front end. Each run_* returns the process exit code.
class DaemonCLI {
public:
    explicit DaemonCLI(std::filesystem::path config_path);
    ~DaemonCLI();

    int run_serve();
    int run_status();
    int run_cluster_status();
    int run_up();
    int run_down();
    int run_operation(const std::string& op);
    int run_prereqs();
    int run_init_config();

private:
    // Load config, run preflight, init logging, wire the managers.
    // Read-only commands skip the tooling check: a missing kind shows up
    // as cluster status Error instead.
    bool load(bool need_repositories, bool need_cluster_tools = true);
    void write_status_file(const DevEnvironment& env);

    std::filesystem::path config_path_;
    Config config_;

    // Declaration order is teardown order in reverse: the orchestrator and
    // catalog go first, the runner last.
    SystemProcessRunner runner_;
    std::unique_ptr<ClusterManager> cluster_;
    std::unique_ptr<StateStore> store_;
    std::unique_ptr<GitRepositoryInspector> inspector_;
    std::unique_ptr<EnvironmentOrchestrator> orchestrator_;
    std::unique_ptr<OperationCatalog> catalog_;
};
