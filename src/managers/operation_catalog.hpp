#pragma once

#include <map>
#include <string>
#include <core/types.hpp>
#include "environment_orchestrator.hpp"
#include "process_runner.hpp"

// Binds operation names to the external commands configured for them and
// starts them through the orchestrator, applying each operation's effect on
// the environment record when the command succeeds.
class OperationCatalog {
public:
    OperationCatalog(EnvironmentOrchestrator& orchestrator, ProcessRunner& runner,
                     std::map<std::string, OperationConfig> operations,
                     DeploymentConfig deployment, std::string mpc_repo_path);

    // InvalidArgument if `op` has no configured command (tracker untouched),
    // AlreadyRunning if another operation is in flight. `extra_env` reaches
    // only the child process and is never stored.
    Result<void> start(const std::string& op,
                       const std::map<std::string, std::string>& extra_env = {});

    // "aws-secrets" → deploying_secrets.
    Result<void> enable_feature(const std::string& feature,
                                const std::map<std::string, std::string>& credentials = {});

    bool has(const std::string& op) const { return operations_.count(op) > 0; }
    std::vector<std::string> names() const;

private:
    EnvironmentOrchestrator& orchestrator_;
    ProcessRunner& runner_;
    std::map<std::string, OperationConfig> operations_;
    DeploymentConfig deployment_;
    std::string mpc_repo_path_;
};
