#pragma once

#include <map>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include <core/cancel_token.hpp>
#include "process_runner.hpp"

struct ToolRequirement {
    std::string name;
    std::vector<std::string> version_argv;
    std::string required;         // minimum version, "1.31.1"
    std::string version_regex;    // first capture group is the version
};

struct PrereqResult {
    std::string name;
    bool installed = false;
    std::string version = "Not Found";
    std::string required;
    std::string status = "missing";   // ok | missing | outdated | unknown
};

struct PrereqReport {
    std::map<std::string, PrereqResult> tools;
    bool all_met = true;
    std::vector<std::string> errors;
};

// go, kind, kubectl, docker, git, helm. podman is only consulted as a
// fallback for docker.
std::vector<ToolRequirement> default_requirements();
ToolRequirement podman_requirement();

class PrereqChecker {
public:
    explicit PrereqChecker(ProcessRunner& runner,
                           std::vector<ToolRequirement> tools = default_requirements());

    PrereqReport check_all(const CancelToken& token);
    PrereqResult check_tool(const ToolRequirement& tool, const CancelToken& token);

    // Empty when nothing matches.
    static std::string extract_version(const std::string& output, const std::string& pattern);

    // True if `version` >= `required`, comparing up to three numeric parts.
    static bool version_at_least(const std::string& version, const std::string& required);

private:
    ProcessRunner& runner_;
    std::vector<ToolRequirement> tools_;
};

nlohmann::json to_json(const PrereqReport& report);
