#include "daemon_cli.hpp"
#include "preflight.hpp"
#include "theme.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/time_utils.hpp>
#include <core/utils.hpp>
#include <managers/environment_json.hpp>
#include <managers/prereq_checker.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <atomic>
#include <chrono>
#include <csignal>
#include <fstream>
#include <iostream>
#include <thread>

namespace fs = std::filesystem;

// ── Signals ────────────────────────────────────────────────

static std::atomic<bool> g_stop_requested{false};

static void on_stop_signal(int) {
    g_stop_requested.store(true);
}

static void install_stop_handlers() {
    struct sigaction sa {};
    sa.sa_handler = on_stop_signal;
    sigemptyset(&sa.sa_mask);
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
}

// Cancels `token` when SIGINT/SIGTERM arrives, for the lifetime of the guard.
class SignalCancelGuard {
public:
    explicit SignalCancelGuard(CancelToken token) : token_(std::move(token)) {
        watcher_ = std::thread([this] {
            while (!done_.load()) {
                if (g_stop_requested.load()) {
                    token_.cancel();
                    return;
                }
                platform::sleep_ms(PROCESS_POLL_MS);
            }
        });
    }
    ~SignalCancelGuard() {
        done_.store(true);
        if (watcher_.joinable()) watcher_.join();
    }

private:
    CancelToken token_;
    std::atomic<bool> done_{false};
    std::thread watcher_;
};

// Diagnostics go to stderr so `status` output stays valid JSON.
static void print_issues(const std::vector<PreflightIssue>& issues) {
    for (const auto& issue : issues) {
        std::cerr << (issue.is_hint ? theme::warn(issue.message) : theme::fail(issue.message));
        std::cerr << theme::step(issue.fix);
    }
}

// ── Setup ──────────────────────────────────────────────────

DaemonCLI::DaemonCLI(fs::path config_path) : config_path_(std::move(config_path)) {
}

DaemonCLI::~DaemonCLI() {
    if (orchestrator_) orchestrator_->shutdown();
}

bool DaemonCLI::load(bool need_repositories, bool need_cluster_tools) {
    auto loaded = Config::load(config_path_);
    if (loaded.is_err()) {
        std::cerr << theme::fail(loaded.error);
        std::cerr << theme::step("Check YAML syntax in " + config_path_.string());
        return false;
    }
    config_ = loaded.value;

    log_init(config_.logging());
    log_info(fmt::format("mpc-daemon {} (config {})", MPCDEV_VERSION, config_path_.string()));

    auto issues = run_preflight_checks(config_path_, config_, need_repositories,
                                       need_cluster_tools);
    print_issues(issues);
    if (has_errors(issues)) {
        std::cerr << "\n";
        return false;
    }

    std::error_code ec;
    fs::create_directories(config_.temp_dir(), ec);
    if (ec) {
        log_warn(fmt::format("Cannot create {}: {}", config_.temp_dir().string(), ec.message()));
    }

    cluster_ = std::make_unique<ClusterManager>(runner_, config_.cluster());
    store_ = std::make_unique<StateStore>(config_.state_dir());
    inspector_ = std::make_unique<GitRepositoryInspector>(runner_);

    OrchestratorOptions opts;
    opts.probe_timeout_secs = config_.cluster().probe_timeout_secs;
    for (const auto& [name, path] : config_.repositories()) {
        if (fs::is_directory(path, ec)) {
            opts.repositories[name] = path;
        } else {
            log_warn(fmt::format("Repository {} not found at {}, not tracking it", name, path));
        }
    }

    orchestrator_ = std::make_unique<EnvironmentOrchestrator>(*cluster_, store_.get(),
                                                              inspector_.get(), opts);
    catalog_ = std::make_unique<OperationCatalog>(*orchestrator_, runner_, config_.operations(),
                                                  config_.deployment(),
                                                  config_.mpc_repo_path().string());
    return true;
}

void DaemonCLI::write_status_file(const DevEnvironment& env) {
    fs::path target = config_.state_dir() / STATUS_FILE_NAME;
    fs::path tmp = target;
    tmp += ".tmp";

    {
        std::ofstream out(tmp.string(), std::ios::trunc);
        if (!out) {
            log_warn("Cannot write " + tmp.string());
            return;
        }
        out << to_json(env).dump(2) << "\n";
    }

    std::error_code ec;
    fs::rename(tmp, target, ec);
    if (ec) log_warn(fmt::format("Cannot replace {}: {}", target.string(), ec.message()));
}

// ── Commands ───────────────────────────────────────────────

int DaemonCLI::run_serve() {
    // kind may be installed while the daemon runs; status reports Error until then.
    if (!load(true, false)) return 1;

    std::cout << theme::banner(MPCDEV_VERSION);
    install_stop_handlers();

    std::cout << theme::step("Scanning environment...");
    auto env = orchestrator_->get_status();
    write_status_file(env);
    std::cout << theme::kv("Session", env.session_id);
    std::cout << theme::kv("Cluster", fmt::format("{} ({})", cluster_->name(),
                                                  cluster_status_name(env.cluster_status)));
    std::cout << theme::kv("Repositories", std::to_string(env.repositories.size()));
    std::cout << theme::kv("Log", log_path());
    std::cout << theme::ok("Serving. Ctrl-C to stop.");

    ClusterStatus last_status = env.cluster_status;
    auto last_refresh = std::chrono::steady_clock::now();
    // Sync shortly after startup, then every REPO_SYNC_INTERVAL_SECS.
    auto next_sync = std::chrono::steady_clock::now();

    while (!g_stop_requested.load()) {
        platform::sleep_ms(250);
        auto now = std::chrono::steady_clock::now();

        if (now >= next_sync) {
            auto started = orchestrator_->start_repository_sync();
            if (started.is_ok()) {
                log_info("Periodic repository sync started");
                next_sync = now + std::chrono::seconds(REPO_SYNC_INTERVAL_SECS);
            } else if (started.kind == ErrorKind::AlreadyRunning) {
                // Busy; retry on the next refresh tick.
                next_sync = now + std::chrono::seconds(STATUS_REFRESH_SECS);
            } else {
                log_debug("Repository sync skipped: " + started.error);
                next_sync = now + std::chrono::seconds(REPO_SYNC_INTERVAL_SECS);
            }
        }

        if (now - last_refresh >= std::chrono::seconds(STATUS_REFRESH_SECS)) {
            last_refresh = now;
            env = orchestrator_->get_status();
            write_status_file(env);
            if (env.cluster_status != last_status) {
                std::cout << theme::info(fmt::format("Cluster {}: {}", cluster_->name(),
                                                     cluster_status_name(env.cluster_status)));
                last_status = env.cluster_status;
            }
        }
    }

    std::cout << "\n" << theme::step("Shutting down...");
    log_info("Received stop signal, shutting down");
    orchestrator_->shutdown();
    std::cout << theme::ok("Stopped.");
    return 0;
}

int DaemonCLI::run_status() {
    if (!load(false, false)) return 1;
    auto env = orchestrator_->get_status();
    std::cout << to_json(env).dump(2) << "\n";
    return 0;
}

int DaemonCLI::run_cluster_status() {
    if (!load(false, false)) return 1;

    CancelToken token = CancelToken::with_deadline_in(
        std::chrono::seconds(config_.cluster().probe_timeout_secs));
    auto report = cluster_->status(token);

    std::cout << theme::kv("Cluster", cluster_->name());
    std::string status = cluster_status_name(report.status);
    switch (report.status) {
        case ClusterStatus::Running:      status = theme::green(status); break;
        case ClusterStatus::Initializing: status = theme::yellow(status); break;
        case ClusterStatus::Error:        status = theme::red(status); break;
        case ClusterStatus::NotRunning:   status = theme::dim(status); break;
    }
    std::cout << theme::kv("Status", status);
    if (!report.detail.empty()) std::cout << theme::kv("Detail", report.detail);
    return report.status == ClusterStatus::Error ? 1 : 0;
}

int DaemonCLI::run_up() {
    if (!load(false)) return 1;
    install_stop_handlers();

    CancelToken token;
    SignalCancelGuard guard(token);

    auto current = cluster_->status(token.with_timeout(
        std::chrono::seconds(config_.cluster().probe_timeout_secs)));
    if (current.status == ClusterStatus::Running) {
        std::cout << theme::ok(fmt::format("Cluster '{}' is already running", cluster_->name()));
        orchestrator_->get_status();
        return 0;
    }

    if (current.status != ClusterStatus::Initializing) {
        std::cout << theme::step(fmt::format("Creating cluster '{}' (this takes a few minutes)...",
                                             cluster_->name()));
        auto created = orchestrator_->create_cluster(token);
        if (created.is_err()) {
            std::cout << theme::fail(created.error);
            return 1;
        }
    }

    std::cout << theme::step("Waiting for the control plane...");
    auto ready = cluster_->wait_until_running(
        token.with_timeout(std::chrono::seconds(CLUSTER_READY_TIMEOUT_SECS)),
        CLUSTER_READY_POLL_SECS * 1000,
        [](const std::string& msg) { std::cout << theme::log(msg) << std::flush; });
    if (ready.is_err()) {
        std::cout << theme::fail(ready.error);
        return 1;
    }

    orchestrator_->get_status();
    std::cout << theme::ok(fmt::format("Cluster '{}' is running", cluster_->name()));
    return 0;
}

int DaemonCLI::run_down() {
    if (!load(false)) return 1;
    install_stop_handlers();

    CancelToken token;
    SignalCancelGuard guard(token);

    std::cout << theme::step(fmt::format("Destroying cluster '{}'...", cluster_->name()));
    auto destroyed = orchestrator_->destroy_environment(token);
    if (destroyed.is_err()) {
        std::cout << theme::fail(destroyed.error);
        return 1;
    }
    std::cout << theme::ok("Environment destroyed");
    return 0;
}

int DaemonCLI::run_operation(const std::string& op) {
    if (!load(true)) return 1;
    install_stop_handlers();

    auto started = catalog_->start(op);
    std::cout << operation_reply_json(op, started).dump() << "\n";
    if (started.is_err()) {
        if (started.kind == ErrorKind::InvalidArgument) {
            auto names = catalog_->names();
            std::cout << theme::step("Configured operations: " +
                                     (names.empty() ? std::string("(none)") : join_args(names)));
        }
        return 1;
    }

    std::cout << theme::step(fmt::format("Running {} (log: {})", op, log_path()));
    while (!orchestrator_->wait_for_idle(std::chrono::milliseconds(250))) {
        if (g_stop_requested.load()) {
            std::cout << theme::warn("Interrupted, canceling...");
            orchestrator_->shutdown();
            break;
        }
    }

    auto result = orchestrator_->operation_status();
    std::string elapsed = format_duration(result.started_at);
    if (result.last_error) {
        std::cout << theme::fail(fmt::format("{} failed after {}", op, elapsed));
        std::cout << *result.last_error << "\n";
        return 1;
    }
    std::cout << theme::ok(fmt::format("{} completed in {}", op, elapsed));
    return 0;
}

int DaemonCLI::run_prereqs() {
    auto loaded = Config::load(config_path_);
    if (loaded.is_ok()) log_init(loaded.value.logging());

    PrereqChecker checker(runner_);
    auto report = checker.check_all(CancelToken());

    std::cout << theme::section("Prerequisites");
    for (const auto& [name, r] : report.tools) {
        std::string line = fmt::format("{:<8} {} (need {})", name, r.version, r.required);
        if (r.status == "ok") {
            std::cout << theme::ok(line);
        } else if (r.status == "unknown") {
            std::cout << theme::warn(line);
        } else {
            std::cout << theme::fail(fmt::format("{} [{}]", line, r.status));
        }
    }
    std::cout << "\n";
    for (const auto& e : report.errors) std::cout << theme::step(e);
    std::cout << (report.all_met ? theme::ok("All prerequisites met")
                                 : theme::fail("Some prerequisites are missing"));
    return report.all_met ? 0 : 1;
}

int DaemonCLI::run_init_config() {
    if (config_exists(config_path_)) {
        std::cout << theme::info("Config already exists at " + config_path_.string());
        return 0;
    }
    auto created = create_default_config(config_path_);
    if (created.is_err()) {
        std::cout << theme::fail(created.error);
        return 1;
    }
    std::cout << theme::ok("Wrote " + config_path_.string());
    return 0;
}
