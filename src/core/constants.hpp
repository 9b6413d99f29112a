#pragma once

#include <cstdint>

// ── Timeouts ────────────────────────────────────────────────
constexpr int SSH_CMD_TIMEOUT_SECS        = 300;   // Max time for a single remote command
constexpr int DEFAULT_CONNECT_TIMEOUT     = 10;    // SSH connect timeout (seconds)
constexpr int REAPER_STOP_TIMEOUT_SECS    = 5;     // Bounded join when stopping the reaper

// ── Session reuse ───────────────────────────────────────────
constexpr int DEFAULT_SESSION_MAX_IDLE    = 300;   // Idle seconds before a session is reaped
constexpr int DEFAULT_SESSION_REAP_INTERVAL = 30;  // Seconds between reaper sweeps
constexpr int MIN_SESSION_MAX_IDLE        = 120;   // Below this, long commands risk being cut off

// ── Fleet ───────────────────────────────────────────────────
constexpr int DEFAULT_MAX_THREADS         = 15;    // Concurrent hosts per fleet run
constexpr int64_t DEFAULT_STALE_THRESHOLD = 86400; // Seconds before refreshed data is stale
constexpr int DEFAULT_SSH_PORT            = 22;

// ── Buffer sizes ────────────────────────────────────────────
constexpr int SSH_READ_BUF_SIZE           = 4096;

// ── Paths ───────────────────────────────────────────────────
constexpr const char* CONFIG_DIR_NAME     = ".fleetwatch";
constexpr const char* CONFIG_FILE_NAME    = "config.yaml";
constexpr const char* LOG_FILE_NAME       = "fleetwatch.log";
