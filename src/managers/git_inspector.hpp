#pragma once

#include <string>
#include <core/types.hpp>
#include <core/cancel_token.hpp>
#include "environment.hpp"
#include "process_runner.hpp"

// Source of RepositoryState. The orchestrator only stores and forwards what
// this reports.
class RepositoryInspector {
public:
    virtual ~RepositoryInspector() = default;

    virtual Result<RepositoryState> inspect(const std::string& name, const std::string& path,
                                            const CancelToken& token) = 0;

    // Fetch from the upstream remote. Never touches the working tree.
    virtual Result<void> sync(const std::string& path, const CancelToken& token) = 0;

    // Full hash of HEAD.
    virtual Result<std::string> head_commit(const std::string& path,
                                            const CancelToken& token) = 0;
};

// Runs git through a ProcessRunner. inspect() uses only local data; sync()
// is the only call that talks to the network.
class GitRepositoryInspector : public RepositoryInspector {
public:
    explicit GitRepositoryInspector(ProcessRunner& runner, std::string git_binary = "git");

    Result<RepositoryState> inspect(const std::string& name, const std::string& path,
                                    const CancelToken& token) override;
    Result<void> sync(const std::string& path, const CancelToken& token) override;
    Result<std::string> head_commit(const std::string& path, const CancelToken& token) override;

private:
    ProcessRunner& runner_;
    std::string git_;

    Result<ProcessResult> git(const std::string& path, std::vector<std::string> args,
                              const CancelToken& token);
};
