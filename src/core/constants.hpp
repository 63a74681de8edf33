#pragma once

// ── Session resource naming ─────────────────────────────────
// Local files under the per-user runtime directory, suffixed with the
// destination identity: wprs-<id>.sock, wprs-<id>-control.sock, wprsc-<id>.pid
constexpr const char* SOCKET_PREFIX        = "wprs-";
constexpr const char* PID_FILE_PREFIX      = "wprsc-";
constexpr const char* SSH_CONTROL_DIR      = "wprs-ssh";

// Remote-side names, relative to the remote runtime directory.
constexpr const char* REMOTE_PULSE_PREFIX  = "wprs-pulse-";
constexpr const char* REMOTE_AGENT_PREFIX  = "wprs-ssh-auth-sock-";

// ── SSH options ─────────────────────────────────────────────
constexpr const char* SSH_BINARY           = "ssh";
constexpr const char* SSH_OPT_STREAM_UNLINK = "StreamLocalBindUnlink=yes";

// ── Control protocol ────────────────────────────────────────
constexpr const char* CONTROL_CMD_CAPS     = "caps";
constexpr const char* CONTROL_STATUS_OK    = "Ok";
constexpr int CONTROL_MAX_RETRIES          = 10;    // additional attempts after the first
constexpr int CONTROL_RETRY_DELAY_MS       = 1000;  // fixed, no backoff
constexpr int CONTROL_READ_BUF_SIZE        = 4096;

// ── Companion process ───────────────────────────────────────
constexpr const char* ENV_WAYLAND_DEBUG    = "WAYLAND_DEBUG";
constexpr const char* ENV_RUST_BACKTRACE   = "RUST_BACKTRACE";

// ── Defaults ────────────────────────────────────────────────
constexpr int DEFAULT_CURSOR_SIZE          = 24;
constexpr int CMD_LOG_TRUNCATE             = 500;
