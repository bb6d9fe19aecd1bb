#include "prereq_checker.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <chrono>
#include <regex>
#include <sstream>

std::vector<ToolRequirement> default_requirements() {
    return {
        {"go",      {"go", "version"},                "1.24.0", R"(go(\d+\.\d+(?:\.\d+)?))"},
        {"kind",    {"kind", "--version"},            "0.26.0", R"((\d+\.\d+\.\d+))"},
        {"kubectl", {"kubectl", "version", "--client"}, "1.31.1", R"(v?(\d+\.\d+\.\d+))"},
        {"docker",  {"docker", "--version"},          "27.0.1", R"((\d+\.\d+\.\d+))"},
        {"git",     {"git", "--version"},             "2.46.0", R"((\d+\.\d+\.\d+))"},
        {"helm",    {"helm", "version", "--short"},   "3.0.0",  R"(v?(\d+\.\d+\.\d+))"},
    };
}

ToolRequirement podman_requirement() {
    return {"podman", {"podman", "--version"}, "5.3.1", R"((\d+\.\d+\.\d+))"};
}

PrereqChecker::PrereqChecker(ProcessRunner& runner, std::vector<ToolRequirement> tools)
    : runner_(runner), tools_(std::move(tools)) {
}

std::string PrereqChecker::extract_version(const std::string& output, const std::string& pattern) {
    try {
        std::regex re(pattern);
        std::smatch m;
        if (std::regex_search(output, m, re) && m.size() > 1) {
            return m[1].str();
        }
    } catch (const std::regex_error& e) {
        log_warn(fmt::format("Bad version pattern '{}': {}", pattern, e.what()));
    }
    return "";
}

bool PrereqChecker::version_at_least(const std::string& version, const std::string& required) {
    auto parts = [](std::string v) {
        if (!v.empty() && v[0] == 'v') v.erase(0, 1);
        std::vector<int> out;
        std::stringstream ss(v);
        std::string item;
        while (std::getline(ss, item, '.')) out.push_back(safe_stoi(item, 0));
        while (out.size() < 3) out.push_back(0);
        return out;
    };

    auto a = parts(version);
    auto b = parts(required);
    for (int i = 0; i < 3; i++) {
        if (a[i] > b[i]) return true;
        if (a[i] < b[i]) return false;
    }
    return true;
}

PrereqResult PrereqChecker::check_tool(const ToolRequirement& tool, const CancelToken& token) {
    PrereqResult result;
    result.name = tool.name;
    result.required = tool.required;

    ProcessRequest req;
    req.argv = tool.version_argv;
    req.combine_output = true;
    req.label = tool.name + " version";

    auto r = runner_.run(req, token.with_timeout(std::chrono::seconds(PREREQ_CHECK_TIMEOUT_SECS)));
    if (r.is_err()) {
        if (r.kind != ErrorKind::ToolUnavailable) {
            result.installed = true;
            result.status = "unknown";
            result.version = "Unknown";
        }
        return result;
    }
    // execvp failure in the child
    if (r.value.exit_code == 127) {
        return result;
    }

    result.installed = true;
    if (r.value.failed()) {
        result.status = "unknown";
        result.version = "Unknown";
        return result;
    }

    std::string version = extract_version(r.value.stdout_data, tool.version_regex);
    if (version.empty()) {
        result.status = "unknown";
        result.version = "Unknown";
        return result;
    }

    result.version = version;
    result.status = version_at_least(version, tool.required) ? "ok" : "outdated";
    return result;
}

PrereqReport PrereqChecker::check_all(const CancelToken& token) {
    PrereqReport report;

    for (const auto& tool : tools_) {
        auto res = check_tool(tool, token);
        if (res.status == "missing") {
            report.errors.push_back(tool.name + " is not installed");
        } else if (res.status == "outdated") {
            report.errors.push_back(fmt::format("{} version {} is below minimum requirement {}",
                                                tool.name, res.version, res.required));
        } else if (res.status == "unknown") {
            report.errors.push_back(tool.name + " version could not be determined");
        }
        report.tools[tool.name] = res;
    }

    // Podman stands in for Docker.
    auto docker = report.tools.find("docker");
    if (docker != report.tools.end() && docker->second.status != "ok") {
        auto podman = check_tool(podman_requirement(), token);
        report.tools["podman"] = podman;

        if (podman.status == "ok") {
            std::vector<std::string> kept;
            for (auto& e : report.errors) {
                if (e.rfind("docker ", 0) != 0) kept.push_back(e);
            }
            report.errors = kept;
        } else {
            report.errors.push_back("Neither Docker nor Podman is available");
        }
    }

    bool podman_ok = report.tools.count("podman") && report.tools["podman"].status == "ok";
    report.all_met = true;
    for (const auto& [name, res] : report.tools) {
        if (res.status == "ok") continue;
        if (name == "docker" && podman_ok) continue;
        if (name == "podman" && podman_ok) continue;
        report.all_met = false;
    }

    log_info(fmt::format("Prerequisite check: {}", report.all_met ? "all met" : "not met"));
    return report;
}

nlohmann::json to_json(const PrereqReport& report) {
    nlohmann::json tools = nlohmann::json::object();
    for (const auto& [name, r] : report.tools) {
        tools[name] = {
            {"name", r.name},
            {"installed", r.installed},
            {"version", r.version},
            {"required", r.required},
            {"status", r.status},
        };
    }
    nlohmann::json j{{"prerequisites", tools}, {"all_met", report.all_met}};
    if (!report.errors.empty()) j["errors"] = report.errors;
    return j;
}
