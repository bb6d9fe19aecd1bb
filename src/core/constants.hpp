#pragma once

constexpr const char* MPCDEV_VERSION = "0.1.0";

// ── Timeouts ────────────────────────────────────────────────
constexpr int STATUS_PROBE_TIMEOUT_SECS  = 10;    // Default bound for a status read
constexpr int CLUSTER_CREATE_TIMEOUT_SECS = 600;  // kind create can take minutes
constexpr int CLUSTER_READY_TIMEOUT_SECS = 600;   // Max wait for Running after create
constexpr int CLUSTER_READY_POLL_SECS    = 5;     // Seconds between readiness polls
constexpr int OPERATION_TIMEOUT_SECS     = 900;   // 15 min, builds are slow
constexpr int PREREQ_CHECK_TIMEOUT_SECS  = 10;    // Per-tool version query
constexpr int GIT_CMD_TIMEOUT_SECS       = 30;
constexpr int GIT_SYNC_TIMEOUT_SECS      = 300;
constexpr int REPO_SYNC_INTERVAL_SECS    = 3600;  // Background upstream fetch in serve mode
constexpr int STATUS_REFRESH_SECS        = 30;    // Background status refresh in serve mode

// ── Process supervision ─────────────────────────────────────
constexpr int PROCESS_POLL_MS            = 100;   // Pipe/cancel polling granularity
constexpr int PROCESS_TERM_GRACE_MS      = 2000;  // SIGTERM → SIGKILL window
constexpr int PROCESS_READ_BUF_SIZE      = 4096;
constexpr int LOG_OUTPUT_EXCERPT         = 2000;  // Bytes of output kept per log line

// ── Operation names ─────────────────────────────────────────
constexpr const char* OP_IDLE               = "idle";
constexpr const char* OP_REBUILDING         = "rebuilding";
constexpr const char* OP_SMOKE_TESTING      = "smoke_testing";
constexpr const char* OP_DEPLOYING_METRICS  = "deploying_metrics";
constexpr const char* OP_DEPLOYING_MPC      = "deploying_mpc";
constexpr const char* OP_DEPLOYING_SECRETS  = "deploying_secrets";
constexpr const char* OP_DEPLOYING_KONFLUX  = "deploying_konflux";
constexpr const char* OP_SYNCING_REPOS      = "syncing_repositories";
constexpr const char* OP_CREATING_CLUSTER   = "creating_cluster";
constexpr const char* OP_DESTROYING_CLUSTER = "destroying_cluster";

// ── Repositories ────────────────────────────────────────────
constexpr const char* MPC_REPO_NAME         = "multi-platform-controller";
constexpr const char* UPSTREAM_REMOTE       = "upstream";
constexpr const char* UPSTREAM_BRANCH_REF   = "upstream/main";

// ── Cluster tooling ─────────────────────────────────────────
// kind delete phrasings that mean "nothing to delete". Each is matched as a
// literal substring of stderr after "{}" is replaced with the cluster name.
// Keep this list narrow: anything unrecognised is a real failure.
constexpr const char* CLUSTER_NOT_FOUND_PHRASES[] = {
    "No kind clusters found",
    "unknown cluster \"{}\"",
    "cluster \"{}\" not found",
    "no nodes found for cluster \"{}\"",
};

// ── Local paths ─────────────────────────────────────────────
constexpr const char* CONFIG_DIR_NAME       = ".mpcdev";
constexpr const char* CONFIG_FILE_NAME      = "config.yaml";
constexpr const char* STATE_FILE_NAME       = "environment.yaml";
constexpr const char* LOG_FILE_NAME         = "mpcdev.log";
constexpr const char* STATUS_FILE_NAME      = "status.json";
