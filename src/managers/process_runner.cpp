#include "process_runner.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <platform/process.hpp>
#include <fmt/format.h>

Result<ProcessResult> SystemProcessRunner::run(const ProcessRequest& request,
                                               const CancelToken& token) {
    std::string label = request.label.empty()
        ? (request.argv.empty() ? std::string("process") : request.argv[0])
        : request.label;

    if (token.cancelled()) {
        return Result<ProcessResult>::Err(ErrorKind::Canceled,
            fmt::format("{}: canceled before start", label));
    }
    if (token.expired()) {
        return Result<ProcessResult>::Err(ErrorKind::TimedOut,
            fmt::format("{}: deadline passed before start", label));
    }

    platform::SpawnOptions opts;
    opts.env = request.env;
    opts.working_dir = request.working_dir;
    opts.merge_stderr = request.combine_output;

    auto handle = platform::spawn(request.argv, opts);
    if (!handle.valid()) {
        log_error(fmt::format("{}: failed to start '{}': {}", label,
                              join_args(request.argv), handle.spawn_error()));
        return Result<ProcessResult>::Err(ErrorKind::ToolUnavailable,
            fmt::format("failed to start '{}': {}", join_args(request.argv),
                        handle.spawn_error()));
    }

    ProcessResult result;
    bool stopped = false;

    // Drain both pipes until EOF, checking the token between polls.
    while (handle.read_output(result.stdout_data, result.stderr_data, PROCESS_POLL_MS)) {
        if (token.should_stop()) { stopped = true; break; }
    }

    // Pipes closed; the child may still be running (e.g. it closed its fds).
    while (!stopped && handle.wait(PROCESS_POLL_MS) < 0 && !handle.exited()) {
        if (token.should_stop()) stopped = true;
    }

    if (stopped) {
        bool timed_out = !token.cancelled();
        handle.terminate(request.term_grace_ms);
        result.exit_code = handle.exit_code();
        log_process(label, request.argv, result);
        if (timed_out) {
            log_warn(fmt::format("{}: deadline exceeded, process terminated", label));
            return Result<ProcessResult>::Err(ErrorKind::TimedOut,
                fmt::format("'{}' timed out and was terminated", join_args(request.argv)));
        }
        log_warn(fmt::format("{}: canceled, process terminated", label));
        return Result<ProcessResult>::Err(ErrorKind::Canceled,
            fmt::format("'{}' was canceled", join_args(request.argv)));
    }

    result.exit_code = handle.exit_code();
    log_process(label, request.argv, result);
    return Result<ProcessResult>::Ok(std::move(result));
}
