#include "operation_catalog.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <memory>

OperationCatalog::OperationCatalog(EnvironmentOrchestrator& orchestrator, ProcessRunner& runner,
                                   std::map<std::string, OperationConfig> operations,
                                   DeploymentConfig deployment, std::string mpc_repo_path)
    : orchestrator_(orchestrator), runner_(runner), operations_(std::move(operations)),
      deployment_(std::move(deployment)), mpc_repo_path_(std::move(mpc_repo_path)) {
}

std::vector<std::string> OperationCatalog::names() const {
    std::vector<std::string> out;
    for (const auto& [name, cfg] : operations_) out.push_back(name);
    return out;
}

Result<void> OperationCatalog::start(const std::string& op,
                                     const std::map<std::string, std::string>& extra_env) {
    auto it = operations_.find(op);
    if (it == operations_.end()) {
        return Result<void>::Err(ErrorKind::InvalidArgument,
                                 fmt::format("operation '{}' is not configured", op));
    }

    ProcessRequest req;
    req.argv = it->second.command;
    req.env = it->second.environment;
    for (const auto& [k, v] : extra_env) req.env[k] = v;
    req.working_dir = it->second.working_dir;
    req.combine_output = true;
    req.label = op;

    // Filled in by the work, read by the success mutator.
    auto source_hash = std::make_shared<std::string>();

    OperationWork work = [this, op, req, source_hash](const CancelToken& token) -> Result<void> {
        auto r = runner_.run(req, token);
        if (r.is_err()) return Result<void>::Err(r.kind, fmt::format("{}: {}", op, r.error));
        if (r.value.failed()) {
            return Result<void>::Err(ErrorKind::OperationFailed,
                fmt::format("{} failed (exit {}):\n{}", op, r.value.exit_code, r.value.stdout_data));
        }

        if (op == OP_DEPLOYING_MPC && orchestrator_.inspector() && !mpc_repo_path_.empty()) {
            auto hash = orchestrator_.inspector()->head_commit(mpc_repo_path_, token);
            if (hash.is_ok()) {
                *source_hash = hash.value;
            } else {
                log_warn(fmt::format("Could not read MPC source commit: {}", hash.error));
            }
        }
        return Result<void>::Ok();
    };

    EnvironmentMutator on_success;
    if (op == OP_DEPLOYING_MPC) {
        DeploymentConfig images = deployment_;
        on_success = [images, source_hash](DevEnvironment& env) {
            MpcDeployment d;
            d.controller_image = images.controller_image;
            d.otp_image = images.otp_image;
            d.deployed_at = now_iso();
            d.source_git_hash = *source_hash;
            env.mpc_deployment = d;
        };
    } else if (op == OP_DEPLOYING_METRICS) {
        on_success = [](DevEnvironment& env) { env.features.metrics_enabled = true; };
    } else if (op == OP_DEPLOYING_SECRETS) {
        on_success = [](DevEnvironment& env) { env.features.aws_enabled = true; };
    } else if (op == OP_DEPLOYING_KONFLUX) {
        on_success = [](DevEnvironment& env) {
            if (env.cluster) env.cluster->konflux_deployed = true;
        };
    }

    return orchestrator_.start_operation(op, std::move(work), std::move(on_success),
                                         it->second.timeout_secs);
}

Result<void> OperationCatalog::enable_feature(const std::string& feature,
                                              const std::map<std::string, std::string>& credentials) {
    if (feature == "aws-secrets") {
        return start(OP_DEPLOYING_SECRETS, credentials);
    }
    return Result<void>::Err(ErrorKind::InvalidArgument,
                             fmt::format("unsupported feature '{}'", feature));
}
