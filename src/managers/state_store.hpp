#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <core/types.hpp>
#include "environment.hpp"

namespace fs = std::filesystem;

// The part of DevEnvironment that survives a daemon restart. Operation
// status is deliberately absent: a fresh daemon is always idle.
struct SessionRecord {
    std::string session_id;
    std::string created_at;
    std::optional<ClusterState> cluster;
    std::optional<MpcDeployment> mpc_deployment;
    FeatureState features;
};

class StateStore {
public:
    explicit StateStore(const fs::path& state_dir);

    // Missing or unreadable file → nullopt (a new session is started).
    std::optional<SessionRecord> load() const;

    Result<void> save(const SessionRecord& record) const;

    const fs::path& path() const { return state_path_; }

private:
    fs::path state_path_;
};
