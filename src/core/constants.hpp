#pragma once

// ── Remote defaults ─────────────────────────────────────────
constexpr const char* SSH_SCHEME         = "ssh";
constexpr int SSH_DEFAULT_PORT           = 22;

// ── Timeouts ────────────────────────────────────────────────
constexpr int DEFAULT_CMD_TIMEOUT_SECS   = 10;      // Remote command execution
constexpr int DEFAULT_LOGIN_TIMEOUT_SECS = 2 * 60;  // Whole chain build (all hops)
constexpr int SSH_KEEPALIVE_SECS         = 30;
constexpr int IO_POLL_INTERVAL_MS        = 10;      // Upper bound for one socket wait
constexpr int CLOSE_GRACE_MS             = 2000;    // Per-hop budget for an orderly close

// ── Buffer sizes ────────────────────────────────────────────
constexpr int SSH_READ_BUF_SIZE          = 16384;
constexpr int TUNNEL_BUF_SIZE            = 16384;

// ── Privilege escalation ────────────────────────────────────
// -S reads the password from stdin, -p '' suppresses the prompt text.
constexpr const char* SUDO_PREFIX        = "sudo -S -p ''";

// ── Exit codes ──────────────────────────────────────────────
constexpr int EXIT_CODE_OK               = 0;
constexpr int EXIT_CODE_REMOTE_FAILED    = 1;
constexpr int EXIT_CODE_USAGE            = 2;
constexpr int EXIT_CODE_FATAL            = 99;

// ── Remote commands ─────────────────────────────────────────
constexpr const char* AVAHI_BROWSE_CMD   = "avahi-browse -aptr --no-db-lookup";

// ── Program ─────────────────────────────────────────────────
constexpr const char* JUMPRUN_VERSION    = "0.4.0";
