#pragma once

#include <string>
#include <map>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

class Config {
public:
    // Load from a YAML file. A missing file yields the defaults; only a file
    // that exists but cannot be parsed is an error. Environment variables
    // (MPC_DEV_ENV_PATH, MPC_REPO_PATH, MPCDEV_LOG_LEVEL) override the file.
    static Result<Config> load(const fs::path& path, const fs::path& cwd = fs::current_path());

    // Same as load() but from YAML text.
    static Result<Config> parse(const std::string& yaml_text,
                                const fs::path& cwd = fs::current_path());

    // Checks that the dev-env, MPC and infra-deployments directories exist.
    Result<void> validate() const;

    // Accessors
    const fs::path& dev_env_path() const { return dev_env_path_; }
    const fs::path& mpc_repo_path() const { return mpc_repo_path_; }
    const fs::path& infra_deployments_path() const { return infra_deployments_path_; }
    const fs::path& temp_dir() const { return temp_dir_; }
    const fs::path& state_dir() const { return state_dir_; }

    const ClusterConfig& cluster() const { return cluster_; }
    const LoggingConfig& logging() const { return logging_; }
    const DeploymentConfig& deployment() const { return deployment_; }
    const std::map<std::string, OperationConfig>& operations() const { return operations_; }
    const std::map<std::string, std::string>& repositories() const { return repositories_; }

public:
    Config() = default;

private:
    fs::path dev_env_path_;
    fs::path mpc_repo_path_;
    fs::path infra_deployments_path_;
    fs::path temp_dir_;
    fs::path state_dir_;

    ClusterConfig cluster_;
    LoggingConfig logging_;
    DeploymentConfig deployment_;
    std::map<std::string, OperationConfig> operations_;
    std::map<std::string, std::string> repositories_;   // name → path

    friend class ConfigBuilder;
};

bool config_exists(const fs::path& path);

// Get paths
fs::path get_config_dir();
fs::path get_config_path();

// Write a commented template. Never overwrites an existing file.
Result<void> create_default_config(const fs::path& path);
