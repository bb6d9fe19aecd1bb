#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include <core/types.hpp>
#include "environment.hpp"

// Client-facing JSON shapes for the status and operation endpoints.

nlohmann::json to_json(const ClusterState& c);
nlohmann::json to_json(const RepositoryState& r);
nlohmann::json to_json(const MpcDeployment& d);
nlohmann::json to_json(const FeatureState& f);
nlohmann::json to_json(const DevEnvironment& env);

// {"status":"started","operation":op}
nlohmann::json operation_started_json(const std::string& op);

// {"status":"conflict"|"error","error_kind":...,"error":msg}
nlohmann::json operation_error_json(ErrorKind kind, const std::string& message);

// Reply for a start-operation request, whichever way it went.
nlohmann::json operation_reply_json(const std::string& op, const Result<void>& started);
