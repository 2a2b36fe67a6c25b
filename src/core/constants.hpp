#pragma once

#include <cstdint>

constexpr const char* BRIDGECTL_VERSION = "0.4.0";

// ── SSH / tunnel ────────────────────────────────────────────
constexpr const char* DEFAULT_SSH_USER   = "root";
constexpr int DEFAULT_SSH_PORT           = 22222;
constexpr const char* DEFAULT_HELPER_URL =
    "https://github.com/Sarfflow/rtunnel/releases/download/nightly/rtunnel-linux-amd64.tar.gz";
constexpr const char* HELPER_BINARY_NAME = "rtunnel";

// ── Timeouts ────────────────────────────────────────────────
constexpr int TUNNEL_PROBE_TIMEOUT_SECS  = 10;    // Connectivity check (echo ok)
constexpr int SSH_CMD_TIMEOUT_SECS       = 300;   // Max time for a single remote command
constexpr int HTTP_JSON_TIMEOUT_SECS     = 60;
constexpr int HTTP_BYTES_TIMEOUT_SECS    = 120;
constexpr int DEFAULT_REMOTE_TIMEOUT     = 90;    // Log retrieval via Actions
constexpr int DEFAULT_BRIDGE_TIMEOUT     = 300;   // Bridge exec via Actions
constexpr int MIN_DEADLINE_SECS          = 5;

// ── Poll intervals ──────────────────────────────────────────
constexpr int RUN_POLL_INTERVAL_MS       = 3000;  // Workflow run status
constexpr int ARTIFACT_POLL_INTERVAL_MS  = 3000;  // Artifact / raw-file availability
constexpr int DISPATCH_SETTLE_MS         = 2000;  // Dispatch -> run becomes listable
constexpr int CORRELATE_ATTEMPTS         = 3;
constexpr int CORRELATE_RETRY_MS         = 1000;
constexpr int RUN_PAGE_LIMIT             = 20;
constexpr int ARTIFACT_LIST_LIMIT        = 100;

constexpr int FOLLOW_READ_WAIT_MS        = 1000;  // Direct follow: per-read wait
constexpr int FOLLOW_STATUS_INTERVAL_MS  = 5000;  // Direct follow: job status check
constexpr int FOLLOW_DIRECT_GRACE_MS     = 3000;
constexpr int FOLLOW_FILE_WAIT_SECS      = 300;   // Direct follow: wait for log to appear
constexpr int FOLLOW_FILE_POLL_MS        = 5000;
constexpr int FOLLOW_INTERVAL_SECS       = 30;    // Mediated follow: full re-fetch period
constexpr int FOLLOW_MEDIATED_GRACE_MS   = 5000;
constexpr int CANCEL_SLICE_MS            = 100;   // Max sleep between interrupt checks

// ── Retry counts ────────────────────────────────────────────
constexpr int FORGE_MAX_RETRIES          = 3;     // 5xx / transport failures
constexpr int FORGE_RETRY_DELAY_MS       = 2000;  // Multiplied by attempt number

// ── Buffer sizes ────────────────────────────────────────────
constexpr int SSH_READ_BUF_SIZE          = 16384;

// ── Log cache ───────────────────────────────────────────────
constexpr int LOG_RETENTION_DAYS         = 7;
constexpr int DEFAULT_FOLLOW_TAIL_LINES  = 50;
