#include "process.hpp"
#include "platform.hpp"
#include <core/constants.hpp>

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace platform {

namespace {

constexpr int WAIT_POLL_MS = 20;

std::vector<std::string> build_environment(const std::map<std::string, std::string>& overrides) {
    std::vector<std::string> env;
    for (char** e = environ; e && *e; ++e) {
        std::string entry(*e);
        auto eq = entry.find('=');
        if (eq != std::string::npos && overrides.count(entry.substr(0, eq))) continue;
        env.push_back(std::move(entry));
    }
    for (const auto& [key, value] : overrides) {
        env.push_back(key + "=" + value);
    }
    return env;
}

// Read once from fd into sink. Closes fd (and sets it to -1) on EOF or error.
void read_fd(int& fd, std::string& sink) {
    char buf[PROCESS_READ_BUF_SIZE];
    ssize_t n = read(fd, buf, sizeof(buf));
    if (n > 0) {
        sink.append(buf, static_cast<size_t>(n));
        return;
    }
    if (n < 0 && (errno == EINTR || errno == EAGAIN)) return;
    close(fd);
    fd = -1;
}

void write_all(int fd, const char* data, size_t len) {
    while (len > 0) {
        ssize_t n = write(fd, data, len);
        if (n < 0) {
            if (errno == EINTR) continue;
            return;
        }
        data += n;
        len -= static_cast<size_t>(n);
    }
}

} // namespace

// ── ProcessHandle ────────────────────────────────────────────

ProcessHandle::ProcessHandle() = default;

ProcessHandle::~ProcessHandle() {
    release();
}

ProcessHandle::ProcessHandle(ProcessHandle&& other) noexcept
    : pid_(other.pid_), out_fd_(other.out_fd_), err_fd_(other.err_fd_),
      exited_(other.exited_), exit_code_(other.exit_code_),
      spawn_error_(std::move(other.spawn_error_)) {
    other.pid_ = -1;
    other.out_fd_ = -1;
    other.err_fd_ = -1;
}

ProcessHandle& ProcessHandle::operator=(ProcessHandle&& other) noexcept {
    if (this != &other) {
        release();
        pid_ = other.pid_;
        out_fd_ = other.out_fd_;
        err_fd_ = other.err_fd_;
        exited_ = other.exited_;
        exit_code_ = other.exit_code_;
        spawn_error_ = std::move(other.spawn_error_);
        other.pid_ = -1;
        other.out_fd_ = -1;
        other.err_fd_ = -1;
    }
    return *this;
}

void ProcessHandle::release() {
    if (pid_ > 0 && !exited_) terminate(PROCESS_TERM_GRACE_MS);
    close_pipes();
}

bool ProcessHandle::valid() const {
    return pid_ > 0;
}

void ProcessHandle::record_status(int status) {
    exited_ = true;
    if (WIFEXITED(status)) {
        exit_code_ = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        exit_code_ = 128 + WTERMSIG(status);
    } else {
        exit_code_ = -1;
    }
}

bool ProcessHandle::running() {
    if (pid_ <= 0 || exited_) return false;
    int status;
    pid_t ret = waitpid(pid_, &status, WNOHANG);
    if (ret == pid_) {
        record_status(status);
        return false;
    }
    return ret == 0;  // 0 means still running
}

int ProcessHandle::wait(int timeout_ms) {
    if (pid_ <= 0) return -1;
    if (exited_) return exit_code_;

    if (timeout_ms < 0) {
        int status;
        while (waitpid(pid_, &status, 0) < 0) {
            if (errno != EINTR) {
                // Not our child any more (already reaped elsewhere).
                exited_ = true;
                return -1;
            }
        }
        record_status(status);
        return exit_code_;
    }

    int elapsed = 0;
    while (true) {
        int status;
        pid_t ret = waitpid(pid_, &status, WNOHANG);
        if (ret == pid_) {
            record_status(status);
            return exit_code_;
        }
        if (ret < 0 && errno != EINTR) {
            exited_ = true;
            return -1;
        }
        if (elapsed >= timeout_ms) return -1;  // timed out
        sleep_ms(WAIT_POLL_MS);
        elapsed += WAIT_POLL_MS;
    }
}

void ProcessHandle::terminate(int grace_ms) {
    if (pid_ <= 0 || exited_) return;

    if (grace_ms > 0) {
        if (kill(-pid_, SIGTERM) != 0) kill(pid_, SIGTERM);
        wait(grace_ms);
        if (exited_) return;
    }

    if (kill(-pid_, SIGKILL) != 0) kill(pid_, SIGKILL);
    wait(-1);
}

bool ProcessHandle::read_output(std::string& out, std::string& err, int timeout_ms) {
    if (out_fd_ < 0 && err_fd_ < 0) return false;

    struct pollfd fds[2];
    nfds_t n = 0;
    if (out_fd_ >= 0) fds[n++] = {out_fd_, POLLIN, 0};
    if (err_fd_ >= 0) fds[n++] = {err_fd_, POLLIN, 0};

    int rc = poll(fds, n, timeout_ms);
    if (rc < 0) {
        if (errno == EINTR) return true;
        close_pipes();
        return false;
    }

    for (nfds_t i = 0; i < n; ++i) {
        if (!(fds[i].revents & (POLLIN | POLLHUP | POLLERR))) continue;
        if (fds[i].fd == out_fd_) {
            read_fd(out_fd_, out);
        } else if (fds[i].fd == err_fd_) {
            read_fd(err_fd_, err);
        }
    }
    return out_fd_ >= 0 || err_fd_ >= 0;
}

void ProcessHandle::close_pipes() {
    if (out_fd_ >= 0) { close(out_fd_); out_fd_ = -1; }
    if (err_fd_ >= 0) { close(err_fd_); err_fd_ = -1; }
}

// ── spawn ────────────────────────────────────────────────────

ProcessHandle spawn(const std::vector<std::string>& argv, const SpawnOptions& options) {
    ProcessHandle handle;

    if (argv.empty() || argv[0].empty()) {
        handle.spawn_error_ = "empty command";
        return handle;
    }

    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    if (pipe2(out_pipe, O_CLOEXEC) != 0) {
        handle.spawn_error_ = std::string("pipe: ") + std::strerror(errno);
        return handle;
    }
    if (!options.merge_stderr && pipe2(err_pipe, O_CLOEXEC) != 0) {
        handle.spawn_error_ = std::string("pipe: ") + std::strerror(errno);
        close(out_pipe[0]);
        close(out_pipe[1]);
        return handle;
    }

    // Everything the child touches is prepared here; no allocation after fork.
    std::vector<std::string> env_strings = build_environment(options.env);
    std::vector<char*> envp;
    envp.reserve(env_strings.size() + 1);
    for (auto& s : env_strings) envp.push_back(s.data());
    envp.push_back(nullptr);

    std::vector<char*> args;
    args.reserve(argv.size() + 1);
    for (const auto& a : argv) args.push_back(const_cast<char*>(a.c_str()));
    args.push_back(nullptr);

    const char* cwd = options.working_dir.empty() ? nullptr : options.working_dir.c_str();
    std::string exec_prefix = "failed to execute " + argv[0] + ": ";
    std::string chdir_prefix = "failed to enter " + options.working_dir + ": ";

    pid_t pid = fork();
    if (pid < 0) {
        handle.spawn_error_ = std::string("fork: ") + std::strerror(errno);
        close(out_pipe[0]);
        close(out_pipe[1]);
        if (err_pipe[0] >= 0) { close(err_pipe[0]); close(err_pipe[1]); }
        return handle;
    }

    if (pid == 0) {
        // Child process
        setpgid(0, 0);

        int devnull = open("/dev/null", O_RDONLY);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            close(devnull);
        }
        dup2(out_pipe[1], STDOUT_FILENO);
        dup2(options.merge_stderr ? out_pipe[1] : err_pipe[1], STDERR_FILENO);

        if (cwd && chdir(cwd) != 0) {
            const char* reason = std::strerror(errno);
            write_all(STDERR_FILENO, chdir_prefix.data(), chdir_prefix.size());
            write_all(STDERR_FILENO, reason, std::strlen(reason));
            write_all(STDERR_FILENO, "\n", 1);
            _exit(127);
        }

        environ = envp.data();
        execvp(args[0], args.data());

        const char* reason = std::strerror(errno);
        write_all(STDERR_FILENO, exec_prefix.data(), exec_prefix.size());
        write_all(STDERR_FILENO, reason, std::strlen(reason));
        write_all(STDERR_FILENO, "\n", 1);
        _exit(127);  // exec failed
    }

    // Parent
    setpgid(pid, pid);
    close(out_pipe[1]);
    if (err_pipe[1] >= 0) close(err_pipe[1]);

    handle.pid_ = pid;
    handle.out_fd_ = out_pipe[0];
    handle.err_fd_ = err_pipe[0];
    return handle;
}

} // namespace platform
