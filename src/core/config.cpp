#include "config.hpp"
#include "constants.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <fstream>

namespace fs = std::filesystem;

// Expand a leading "~/" and make relative paths absolute against `base`.
static fs::path resolve_path(const std::string& raw, const fs::path& base) {
    if (raw.empty()) return {};
    fs::path p;
    if (raw == "~" || raw.rfind("~/", 0) == 0) {
        p = platform::home_dir() / raw.substr(raw.size() > 1 ? 2 : 1);
    } else {
        p = raw;
    }
    if (p.is_relative()) p = base / p;
    return p.lexically_normal();
}

class ConfigBuilder {
public:
    static Result<Config> build(const YAML::Node& root, const fs::path& cwd) {
        Config cfg;

        if (root && !root.IsNull() && !root.IsMap()) {
            return Result<Config>::Err(ErrorKind::ConfigError,
                                       "config root must be a mapping");
        }

        YAML::Node paths = root ? root["paths"] : YAML::Node();
        resolve_paths(cfg, paths, cwd);

        if (root && root["cluster"] && root["cluster"].IsMap()) {
            cfg.cluster_ = parse_cluster(root["cluster"], cfg.dev_env_path_);
        }
        if (root && root["logging"] && root["logging"].IsMap()) {
            cfg.logging_ = parse_logging(root["logging"], cfg.dev_env_path_);
        }
        if (root && root["deployment"] && root["deployment"].IsMap()) {
            const auto& n = root["deployment"];
            cfg.deployment_.controller_image =
                n["controller_image"].as<std::string>(cfg.deployment_.controller_image);
            cfg.deployment_.otp_image = n["otp_image"].as<std::string>(cfg.deployment_.otp_image);
        }

        if (root && root["operations"] && root["operations"].IsMap()) {
            for (const auto& kv : root["operations"]) {
                std::string name = kv.first.as<std::string>();
                auto op = parse_operation(name, kv.second, cfg.mpc_repo_path_);
                if (op.is_err()) return Result<Config>::Err(ErrorKind::ConfigError, op.error);
                cfg.operations_[name] = op.value;
            }
        }

        cfg.repositories_[MPC_REPO_NAME] = cfg.mpc_repo_path_.string();
        if (root && root["repositories"] && root["repositories"].IsMap()) {
            for (const auto& kv : root["repositories"]) {
                std::string path = kv.second.as<std::string>("");
                if (path.empty()) continue;
                cfg.repositories_[kv.first.as<std::string>()] =
                    resolve_path(path, cfg.dev_env_path_).string();
            }
        }

        std::string level = platform::env_or_empty("MPCDEV_LOG_LEVEL");
        if (!level.empty()) cfg.logging_.level = level;
        if (cfg.logging_.file.empty()) {
            cfg.logging_.file = (cfg.temp_dir_ / LOG_FILE_NAME).string();
        }

        return Result<Config>::Ok(cfg);
    }

private:
    static void resolve_paths(Config& cfg, const YAML::Node& paths, const fs::path& cwd) {
        auto yaml_str = [&](const char* key) {
            return (paths && paths.IsMap()) ? paths[key].as<std::string>("") : std::string();
        };

        // MPC_DEV_ENV_PATH → paths.dev_env → cwd
        std::string dev_env = platform::env_or_empty("MPC_DEV_ENV_PATH");
        if (dev_env.empty()) dev_env = yaml_str("dev_env");
        cfg.dev_env_path_ = dev_env.empty() ? cwd.lexically_normal() : resolve_path(dev_env, cwd);

        fs::path parent = cfg.dev_env_path_.parent_path();

        // MPC_REPO_PATH → paths.mpc_repo → sibling checkout
        std::string mpc = platform::env_or_empty("MPC_REPO_PATH");
        if (mpc.empty()) mpc = yaml_str("mpc_repo");
        cfg.mpc_repo_path_ = mpc.empty() ? parent / MPC_REPO_NAME
                                         : resolve_path(mpc, cfg.dev_env_path_);

        std::string infra = yaml_str("infra_deployments");
        cfg.infra_deployments_path_ = infra.empty() ? parent / "infra-deployments"
                                                    : resolve_path(infra, cfg.dev_env_path_);

        cfg.temp_dir_ = cfg.dev_env_path_ / "temp";

        std::string state = yaml_str("state_dir");
        cfg.state_dir_ = state.empty() ? get_config_dir() / "state"
                                       : resolve_path(state, cfg.dev_env_path_);
    }

    static ClusterConfig parse_cluster(const YAML::Node& n, const fs::path& base) {
        ClusterConfig c;
        c.name = n["name"].as<std::string>(c.name);
        c.provider = n["provider"].as<std::string>(c.provider);
        c.kind_binary = n["kind_binary"].as<std::string>(c.kind_binary);
        c.kubectl_binary = n["kubectl_binary"].as<std::string>(c.kubectl_binary);
        c.kind_config = resolve_path(n["kind_config"].as<std::string>(""), base).string();
        c.kubeconfig_path = resolve_path(n["kubeconfig"].as<std::string>(""), base).string();
        c.create_timeout_secs = n["create_timeout"].as<int>(c.create_timeout_secs);
        c.destroy_timeout_secs = n["destroy_timeout"].as<int>(c.destroy_timeout_secs);
        c.probe_timeout_secs = n["probe_timeout"].as<int>(c.probe_timeout_secs);
        return c;
    }

    static LoggingConfig parse_logging(const YAML::Node& n, const fs::path& base) {
        LoggingConfig l;
        l.level = n["level"].as<std::string>(l.level);
        l.file = resolve_path(n["file"].as<std::string>(""), base).string();
        l.echo_stderr = n["echo_stderr"].as<bool>(l.echo_stderr);
        return l;
    }

    static Result<OperationConfig> parse_operation(const std::string& name, const YAML::Node& n,
                                                   const fs::path& default_dir) {
        OperationConfig op;

        // Bare shorthand: `rebuilding: [make, build]`
        YAML::Node cmd = n.IsMap() ? n["command"] : n;
        if (cmd && cmd.IsSequence()) {
            for (const auto& arg : cmd) op.command.push_back(arg.as<std::string>());
        } else if (cmd && cmd.IsScalar()) {
            op.command.push_back(cmd.as<std::string>());
        }
        if (op.command.empty()) {
            return Result<OperationConfig>::Err(
                fmt::format("operation '{}' has no command", name));
        }

        if (n.IsMap()) {
            std::string wd = n["working_dir"].as<std::string>("");
            op.working_dir = wd.empty() ? default_dir.string()
                                        : resolve_path(wd, default_dir).string();
            op.timeout_secs = n["timeout"].as<int>(op.timeout_secs);
            if (n["environment"] && n["environment"].IsMap()) {
                for (const auto& kv : n["environment"]) {
                    op.environment[kv.first.as<std::string>()] = kv.second.as<std::string>("");
                }
            }
        } else {
            op.working_dir = default_dir.string();
        }
        return Result<OperationConfig>::Ok(op);
    }
};

Result<Config> Config::parse(const std::string& yaml_text, const fs::path& cwd) {
    try {
        YAML::Node root = YAML::Load(yaml_text);
        return ConfigBuilder::build(root, cwd);
    } catch (const YAML::Exception& e) {
        return Result<Config>::Err(ErrorKind::ConfigError,
                                   std::string("Failed to parse config: ") + e.what());
    }
}

Result<Config> Config::load(const fs::path& path, const fs::path& cwd) {
    if (!fs::exists(path)) {
        return ConfigBuilder::build(YAML::Node(), cwd);
    }
    try {
        YAML::Node root = YAML::LoadFile(path.string());
        return ConfigBuilder::build(root, cwd);
    } catch (const YAML::Exception& e) {
        return Result<Config>::Err(ErrorKind::ConfigError,
            fmt::format("Failed to parse {}: {}", path.string(), e.what()));
    }
}

Result<void> Config::validate() const {
    struct Check { const char* label; const fs::path* path; };
    const Check checks[] = {
        {"MPC_DEV_ENV_PATH", &dev_env_path_},
        {"MPC_REPO_PATH", &mpc_repo_path_},
        {"infra-deployments path", &infra_deployments_path_},
    };

    for (const auto& c : checks) {
        std::error_code ec;
        bool found = fs::is_directory(*c.path, ec);
        if (ec) {
            return Result<void>::Err(ErrorKind::ConfigError,
                fmt::format("cannot access {}: {} ({})", c.label, c.path->string(), ec.message()));
        }
        if (!found) {
            return Result<void>::Err(ErrorKind::ConfigError,
                fmt::format("{} does not exist: {}", c.label, c.path->string()));
        }
    }
    return Result<void>::Ok();
}

bool config_exists(const fs::path& path) {
    return fs::exists(path);
}

fs::path get_config_dir() {
    return platform::home_dir() / CONFIG_DIR_NAME;
}

fs::path get_config_path() {
    return get_config_dir() / CONFIG_FILE_NAME;
}

Result<void> create_default_config(const fs::path& path) {
    // Don't overwrite existing config
    if (fs::exists(path)) {
        return Result<void>::Ok();
    }

    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);
    if (ec) {
        return Result<void>::Err(ErrorKind::ConfigError,
            fmt::format("Failed to create {}: {}", path.parent_path().string(), ec.message()));
    }

    const char* default_config = R"(# MPC dev environment daemon configuration

# Directory layout. Empty values are auto-detected:
#   dev_env            current directory (or $MPC_DEV_ENV_PATH)
#   mpc_repo           ../multi-platform-controller (or $MPC_REPO_PATH)
#   infra_deployments  ../infra-deployments
paths:
  dev_env: ""
  mpc_repo: ""
  infra_deployments: ""
  state_dir: ""                  # default ~/.mpcdev/state

cluster:
  name: "konflux"
  provider: "podman"             # KIND_EXPERIMENTAL_PROVIDER
  kind_config: ""                # e.g. kind-config.yaml
  kubeconfig: ""
  create_timeout: 600
  destroy_timeout: 300
  probe_timeout: 10

logging:
  level: "info"                  # debug | info | warn | error
  file: ""                       # default <dev_env>/temp/mpcdev.log
  echo_stderr: false

deployment:
  controller_image: "localhost/multi-platform-controller:latest"
  otp_image: "localhost/multi-platform-otp:latest"

# Long-running operations. working_dir defaults to the MPC repository.
operations:
  rebuilding:
    command: ["make", "dev-image"]
    timeout: 900
  smoke_testing:
    command: ["make", "test"]
  deploying_mpc:
    command: ["make", "dev-deploy"]
  # deploying_metrics:
  #   command: ["./hack/deploy-metrics.sh"]
  # deploying_secrets:
  #   command: ["./hack/deploy-secrets.sh"]

# Extra repositories to track (name: path).
# multi-platform-controller is always tracked.
repositories: {}
)";

    std::ofstream out(path);
    if (!out) {
        return Result<void>::Err(ErrorKind::ConfigError,
                                 "Failed to create config file at " + path.string());
    }
    out << default_config;
    if (!out.good()) {
        return Result<void>::Err(ErrorKind::ConfigError,
                                 "Failed to write config file at " + path.string());
    }
    return Result<void>::Ok();
}
