#include "git_inspector.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <chrono>

GitRepositoryInspector::GitRepositoryInspector(ProcessRunner& runner, std::string git_binary)
    : runner_(runner), git_(std::move(git_binary)) {
}

Result<ProcessResult> GitRepositoryInspector::git(const std::string& path,
                                                  std::vector<std::string> args,
                                                  const CancelToken& token) {
    ProcessRequest req;
    req.argv = {git_, "-C", path};
    for (auto& a : args) req.argv.push_back(std::move(a));
    req.env["GIT_TERMINAL_PROMPT"] = "0";
    req.label = "git";
    return runner_.run(req, token);
}

Result<RepositoryState> GitRepositoryInspector::inspect(const std::string& name,
                                                        const std::string& path,
                                                        const CancelToken& token) {
    auto t = token.with_timeout(std::chrono::seconds(GIT_CMD_TIMEOUT_SECS));

    auto check = git(path, {"rev-parse", "--git-dir"}, t);
    if (check.is_err()) return Result<RepositoryState>::Err(check.kind, check.error);
    if (check.value.failed()) {
        return Result<RepositoryState>::Err(ErrorKind::InvalidArgument,
                                            "not a git repository: " + path);
    }

    RepositoryState repo;
    repo.name = name;
    repo.path = path;

    auto branch = git(path, {"rev-parse", "--abbrev-ref", "HEAD"}, t);
    if (branch.is_err()) return Result<RepositoryState>::Err(branch.kind, branch.error);
    repo.current_branch = trimmed(branch.value.stdout_data);
    if (branch.value.failed() || repo.current_branch.empty()) {
        return Result<RepositoryState>::Err(fmt::format(
            "failed to get current branch of {}: {}", path, trimmed(branch.value.stderr_data)));
    }

    auto status = git(path, {"status", "--porcelain"}, t);
    if (status.is_err()) return Result<RepositoryState>::Err(status.kind, status.error);
    if (status.value.failed()) {
        return Result<RepositoryState>::Err(fmt::format(
            "failed to check status of {}: {}", path, trimmed(status.value.stderr_data)));
    }
    repo.has_local_changes = !trimmed(status.value.stdout_data).empty();

    // No upstream remote (or no fetched upstream/main) is not an error: 0 behind.
    auto behind = git(path, {"rev-list", "--count",
                             fmt::format("{}..{}", repo.current_branch, UPSTREAM_BRANCH_REF)}, t);
    if (behind.is_err()) return Result<RepositoryState>::Err(behind.kind, behind.error);
    if (behind.value.success()) {
        repo.commits_behind_upstream = safe_stoi(trimmed(behind.value.stdout_data), 0);
    }

    return Result<RepositoryState>::Ok(repo);
}

Result<void> GitRepositoryInspector::sync(const std::string& path, const CancelToken& token) {
    auto t = token.with_timeout(std::chrono::seconds(GIT_SYNC_TIMEOUT_SECS));

    auto remote = git(path, {"remote", "get-url", UPSTREAM_REMOTE}, t);
    if (remote.is_err()) return Result<void>::Err(remote.kind, remote.error);
    if (remote.value.failed()) {
        return Result<void>::Err(ErrorKind::ConfigError, fmt::format(
            "upstream remote not configured in {} (use: git remote add upstream <url>)", path));
    }

    auto fetch = git(path, {"fetch", UPSTREAM_REMOTE}, t);
    if (fetch.is_err()) return Result<void>::Err(fetch.kind, fetch.error);
    if (fetch.value.failed()) {
        return Result<void>::Err(fmt::format("failed to fetch upstream in {} (exit {}): {}",
                                             path, fetch.value.exit_code,
                                             fetch.value.stderr_data));
    }
    log_info(fmt::format("Fetched {} in {}", UPSTREAM_REMOTE, path));
    return Result<void>::Ok();
}

Result<std::string> GitRepositoryInspector::head_commit(const std::string& path,
                                                        const CancelToken& token) {
    auto r = git(path, {"rev-parse", "HEAD"},
                 token.with_timeout(std::chrono::seconds(GIT_CMD_TIMEOUT_SECS)));
    if (r.is_err()) return Result<std::string>::Err(r.kind, r.error);
    if (r.value.failed()) {
        return Result<std::string>::Err(fmt::format("failed to read HEAD of {}: {}",
                                                    path, trimmed(r.value.stderr_data)));
    }
    return Result<std::string>::Ok(trimmed(r.value.stdout_data));
}
