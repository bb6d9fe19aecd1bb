#include "state_store.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <fstream>

StateStore::StateStore(const fs::path& state_dir)
    : state_path_(state_dir / STATE_FILE_NAME) {
}

std::optional<SessionRecord> StateStore::load() const {
    if (!fs::exists(state_path_)) {
        return std::nullopt;
    }

    SessionRecord rec;
    try {
        YAML::Node root = YAML::LoadFile(state_path_.string());
        if (!root.IsMap()) return std::nullopt;

        rec.session_id = root["session_id"].as<std::string>("");
        rec.created_at = root["created_at"].as<std::string>("");
        if (rec.session_id.empty()) return std::nullopt;

        if (root["cluster"] && root["cluster"].IsMap()) {
            const auto& n = root["cluster"];
            ClusterState c;
            c.name = n["name"].as<std::string>("");
            c.created_at = n["created_at"].as<std::string>("");
            c.status = parse_declared_status(n["status"].as<std::string>("stopped"));
            c.kubeconfig_path = n["kubeconfig_path"].as<std::string>("");
            c.konflux_deployed = n["konflux_deployed"].as<bool>(false);
            rec.cluster = c;
        }

        if (root["mpc_deployment"] && root["mpc_deployment"].IsMap()) {
            const auto& n = root["mpc_deployment"];
            MpcDeployment d;
            d.controller_image = n["controller_image"].as<std::string>("");
            d.otp_image = n["otp_image"].as<std::string>("");
            d.deployed_at = n["deployed_at"].as<std::string>("");
            d.source_git_hash = n["source_git_hash"].as<std::string>("");
            rec.mpc_deployment = d;
        }

        if (root["features"] && root["features"].IsMap()) {
            const auto& n = root["features"];
            rec.features.aws_enabled = n["aws_enabled"].as<bool>(false);
            rec.features.ibm_enabled = n["ibm_enabled"].as<bool>(false);
            rec.features.metrics_enabled = n["metrics_enabled"].as<bool>(false);
        }
    } catch (const std::exception& e) {
        // Corrupted state file, start fresh
        log_warn(fmt::format("Ignoring unreadable state file {}: {}", state_path_.string(), e.what()));
        return std::nullopt;
    }

    return rec;
}

Result<void> StateStore::save(const SessionRecord& rec) const {
    std::error_code ec;
    fs::create_directories(state_path_.parent_path(), ec);
    if (ec) {
        return Result<void>::Err(fmt::format("Failed to create state directory {}: {}",
                                             state_path_.parent_path().string(), ec.message()));
    }

    YAML::Emitter out;
    out << YAML::BeginMap;
    out << YAML::Key << "session_id" << YAML::Value << rec.session_id;
    out << YAML::Key << "created_at" << YAML::Value << rec.created_at;

    if (rec.cluster) {
        const auto& c = *rec.cluster;
        out << YAML::Key << "cluster" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "name" << YAML::Value << c.name;
        out << YAML::Key << "created_at" << YAML::Value << c.created_at;
        out << YAML::Key << "status" << YAML::Value << declared_status_name(c.status);
        out << YAML::Key << "kubeconfig_path" << YAML::Value << c.kubeconfig_path;
        out << YAML::Key << "konflux_deployed" << YAML::Value << c.konflux_deployed;
        out << YAML::EndMap;
    }

    if (rec.mpc_deployment) {
        const auto& d = *rec.mpc_deployment;
        out << YAML::Key << "mpc_deployment" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "controller_image" << YAML::Value << d.controller_image;
        out << YAML::Key << "otp_image" << YAML::Value << d.otp_image;
        out << YAML::Key << "deployed_at" << YAML::Value << d.deployed_at;
        out << YAML::Key << "source_git_hash" << YAML::Value << d.source_git_hash;
        out << YAML::EndMap;
    }

    out << YAML::Key << "features" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "aws_enabled" << YAML::Value << rec.features.aws_enabled;
    out << YAML::Key << "ibm_enabled" << YAML::Value << rec.features.ibm_enabled;
    out << YAML::Key << "metrics_enabled" << YAML::Value << rec.features.metrics_enabled;
    out << YAML::EndMap;

    out << YAML::EndMap;

    // Write beside the target, then rename, so a crash never leaves half a file.
    fs::path tmp = state_path_;
    tmp += ".tmp";
    {
        std::ofstream fout(tmp.string(), std::ios::trunc);
        if (!fout) {
            return Result<void>::Err("Failed to write state file " + tmp.string());
        }
        fout << out.c_str() << "\n";
        if (!fout.good()) {
            return Result<void>::Err("Failed to write state file " + tmp.string());
        }
    }
    fs::rename(tmp, state_path_, ec);
    if (ec) {
        fs::remove(tmp, ec);
        return Result<void>::Err(fmt::format("Failed to replace {}", state_path_.string()));
    }
    return Result<void>::Ok();
}
