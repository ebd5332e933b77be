#pragma once

#include <cstdint>

// ── Version ─────────────────────────────────────────────────
constexpr const char* JUMPLINE_VERSION = "0.4.0";

// ── SSH ─────────────────────────────────────────────────────
constexpr int SSH_PORT                   = 22;
constexpr const char* SSH_PTY_TERM       = "vt100";

// ── Timeouts ────────────────────────────────────────────────
constexpr int SSH_CONNECT_TIMEOUT_SECS   = 30;    // TCP connect to a directly dialled host
constexpr int CHANNEL_OPEN_TIMEOUT_SECS  = 30;    // EAGAIN budget when opening channels/tunnels
constexpr int INTERRUPT_POLL_MS          = 50;    // Slice used to observe Ctrl-C while waiting
constexpr int TUNNEL_POLL_MS             = 50;    // Tunnel pump poll interval
constexpr int PROMPT_POLL_MS             = 100;   // Interrupt prompt stdin poll interval

// ── Retry defaults ──────────────────────────────────────────
constexpr int DEFAULT_CONNECT_RETRY_INTERVAL_SECS = 10;
constexpr int DEFAULT_CMD_RETRY_INTERVAL_SECS     = 5;

// ── Buffer sizes ────────────────────────────────────────────
constexpr int SSH_READ_BUF_SIZE          = 4096;
constexpr int TUNNEL_BUF_SIZE            = 16384;
constexpr int SFTP_BUF_SIZE              = 4096;

// ── Command handling ────────────────────────────────────────
constexpr const char* REDACTION_MARKER   = "XXXXXXX";
constexpr const char* COMMAND_JOINER     = " && ";
constexpr const char* INTERRUPT_SEQUENCE = "\x03";

// ── HTTP through curl ───────────────────────────────────────
constexpr int CURL_EXIT_PARTIAL_FILE     = 18;    // CURLE_PARTIAL_FILE, reported for HEAD
constexpr const char* CURL_BASE_COMMAND  = "curl -is --http1.0 ";

// ── Paths ───────────────────────────────────────────────────
constexpr const char* CONFIG_DIR_NAME    = ".jumpline";
constexpr const char* CONFIG_FILE_NAME   = "config.yaml";
constexpr const char* DEFAULT_LOG_NAME   = "jumpline_debug.log";
