#pragma once

#include <cstdint>

// ── SSH transport ───────────────────────────────────────────
constexpr int SSH_DEFAULT_PORT           = 22;
constexpr int SSH_CONNECT_TIMEOUT_SECS   = 30;    // TCP connect + handshake
constexpr int SSH_CMD_TIMEOUT_SECS       = 300;   // Max time for a single SSH command
constexpr int SSH_KEEPALIVE_SECS         = 30;
constexpr int SSH_EAGAIN_SLEEP_MS        = 10;
constexpr int SSH_HANDSHAKE_SLEEP_MS     = 100;

// ── Buffer sizes ────────────────────────────────────────────
constexpr int SSH_READ_BUF_SIZE          = 4096;
constexpr int SCP_CHUNK_SIZE             = 32768;
constexpr int LOG_OUTPUT_PREVIEW         = 500;

// ── Run pipeline ────────────────────────────────────────────
// Heuristic wait between launching the binary and probing its pid.
constexpr int DEFAULT_STARTUP_PAUSE_SECS = 4;
constexpr const char* DEFAULT_BIND_ADDR  = "127.0.0.1";
constexpr const char* DEFAULT_BIND_PORT  = "5700";

// ── Remote layout templates ─────────────────────────────────
// Use fmt::format with these: fmt::format(REMOTE_DEPLOY_DIR, subject_name)
constexpr const char* REMOTE_DEPLOY_DIR     = "/tmp/{}";
constexpr const char* REMOTE_ARCHIVE_PATH   = "/tmp/{}-archive.tar.xz";
constexpr const char* REMOTE_BINARY_PATH    = "/tmp/{0}/bin/{0}";
constexpr const char* ARCHIVE_BINARY_ENTRY  = "bin/{}";

// Sentinel file names inside the deploy directory
constexpr const char* SENTINEL_PID          = "pid";
constexpr const char* SENTINEL_BIND_ADDR    = "bind_addr";
constexpr const char* SENTINEL_BIND_PORT    = "bind_port";

// ── Local paths ─────────────────────────────────────────────
constexpr const char* DELTA_CONFIG_DIR      = ".delta";
constexpr const char* DELTA_CONFIG_FILE     = "config.yaml";
constexpr const char* DELTA_LOG_FILE        = "delta_debug.log";

constexpr const char* DELTA_VERSION         = "0.4.0";
