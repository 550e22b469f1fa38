#pragma once

#include <cstddef>

// ── Instance lock ───────────────────────────────────────────
// Shared by every instance on the host; lives in the temp dir.
constexpr const char* LOCK_FILE_NAME          = "matlab-mcp-core-server.lock";
constexpr int KILL_POLL_ATTEMPTS              = 10;    // liveness checks after a kill
constexpr int KILL_POLL_INTERVAL_MS           = 100;   // 10 * 100ms = 1s max wait
constexpr int LOCK_CLAIM_MAX_ATTEMPTS         = 3;     // restarts when an exclusive create loses a race
constexpr int LOCK_CLAIM_BACKOFF_MS           = 50;    // doubled after each lost race

// ── TLS ─────────────────────────────────────────────────────
constexpr int CLOCK_SKEW_TOLERANCE_HOURS      = 24;
constexpr int HTTPS_DEFAULT_PORT              = 443;
constexpr int HTTPS_TIMEOUT_SECS              = 30;
constexpr int HTTP_READ_BUF_SIZE              = 16384;
constexpr size_t HTTP_MAX_HEADER_BYTES        = 64 * 1024;
constexpr size_t HTTP_MAX_BODY_BYTES          = 64 * 1024 * 1024;

// ── Paths ───────────────────────────────────────────────────
constexpr const char* CONFIG_DIR_NAME         = ".mcpcore";
constexpr const char* CONFIG_FILE_NAME        = "config.yaml";
constexpr const char* DEBUG_LOG_FILE_NAME     = "mcpcore_debug.log";

// ── Exit codes ──────────────────────────────────────────────
constexpr int EXIT_STARTUP_FAILURE            = 1;
constexpr int EXIT_ALREADY_RUNNING            = 2;
constexpr int EXIT_LOCK_IO                    = 3;
constexpr int EXIT_LOCK_CONTENTION            = 4;
constexpr int EXIT_TLS_CONFIG                 = 5;
constexpr int EXIT_TRANSPORT                  = 6;

constexpr const char* MCPCORE_VERSION         = "0.3.0";
