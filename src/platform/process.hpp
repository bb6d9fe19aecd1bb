#pragma once

#include <map>
#include <string>
#include <vector>

namespace platform {

struct SpawnOptions {
    std::map<std::string, std::string> env;   // added to / overriding the inherited environment
    std::string working_dir;                  // empty = inherit
    bool merge_stderr = false;                // child stderr shares the stdout pipe
};

// Owning handle to a spawned child process and its output pipes.
// The child runs in its own process group so terminate() reaches any
// grandchildren it forks. Destroying a handle whose child is still running
// terminates it.
class ProcessHandle {
public:
    ProcessHandle();
    ~ProcessHandle();

    ProcessHandle(ProcessHandle&& other) noexcept;
    ProcessHandle& operator=(ProcessHandle&& other) noexcept;
    ProcessHandle(const ProcessHandle&) = delete;
    ProcessHandle& operator=(const ProcessHandle&) = delete;

    // True if the process handle is valid (was successfully spawned).
    bool valid() const;

    // True if the process is still running. Reaps it if it has exited.
    bool running();

    // Wait for the process to exit. Returns exit code, or -1 on timeout.
    // timeout_ms = -1 means indefinite wait. Death by signal N reports 128+N.
    int wait(int timeout_ms = -1);

    bool exited() const { return exited_; }
    int exit_code() const { return exit_code_; }

    // SIGTERM the process group, then SIGKILL once grace_ms has passed.
    // grace_ms <= 0 sends SIGKILL straight away. Reaps the child.
    void terminate(int grace_ms);

    // Append whatever the child has written since the last call, waiting up to
    // timeout_ms for data. Returns false once both pipes have reached EOF.
    bool read_output(std::string& out, std::string& err, int timeout_ms);

    // Why spawn() failed, when !valid().
    const std::string& spawn_error() const { return spawn_error_; }

    int native_handle() const { return pid_; }

private:
    void close_pipes();
    void record_status(int status);
    void release();

    int pid_ = -1;
    int out_fd_ = -1;
    int err_fd_ = -1;
    bool exited_ = false;
    int exit_code_ = -1;
    std::string spawn_error_;

    friend ProcessHandle spawn(const std::vector<std::string>& argv,
                               const SpawnOptions& options);
};

// Spawn argv[0] (looked up on PATH) with stdin from /dev/null and stdout/stderr
// captured through pipes. An exec failure surfaces as exit code 127 with the
// reason written to the child's stderr.
ProcessHandle spawn(const std::vector<std::string>& argv,
                    const SpawnOptions& options = SpawnOptions());

} // namespace platform
