#pragma once

#include <map>
#include <string>
#include <vector>
#include <core/types.hpp>
#include <core/cancel_token.hpp>
#include <core/constants.hpp>

struct ProcessRequest {
    std::vector<std::string> argv;
    std::map<std::string, std::string> env;   // overrides on top of the daemon's environment
    std::string working_dir;
    bool combine_output = false;              // stderr folded into stdout_data, in order
    std::string label;                        // log prefix, defaults to argv[0]
    int term_grace_ms = PROCESS_TERM_GRACE_MS;  // SIGTERM → SIGKILL window once the token fires
};

// Executes external lifecycle commands. Implementations must honour the
// token (terminate the child and return promptly) and must report a
// non-zero exit as data, never as an error.
class ProcessRunner {
public:
    virtual ~ProcessRunner() = default;

    // Err kinds: Canceled, TimedOut (token fired), ToolUnavailable (could not spawn).
    virtual Result<ProcessResult> run(const ProcessRequest& request,
                                      const CancelToken& token) = 0;
};

// POSIX implementation on top of platform::spawn.
class SystemProcessRunner : public ProcessRunner {
public:
    Result<ProcessResult> run(const ProcessRequest& request,
                              const CancelToken& token) override;
};
