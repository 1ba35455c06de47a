#pragma once

// ── Version ─────────────────────────────────────────────────
constexpr const char* ROXY_VERSION = "0.2.0";

// ── Files ───────────────────────────────────────────────────
constexpr const char* DEFAULT_CONFIG_FILE   = "roxy.yaml";
constexpr const char* DEFAULT_LOG_FILE_NAME = "roxy.log";

// ── Ports ───────────────────────────────────────────────────
constexpr int MIN_PORT = 1;
constexpr int MAX_PORT = 65535;

// ── Remote ports per protocol ───────────────────────────────
constexpr int SSH_PORT    = 22;
constexpr int TELNET_PORT = 23;
constexpr int HTTP_PORT   = 80;
constexpr int HTTPS_PORT  = 443;

// ── Timeouts ────────────────────────────────────────────────
constexpr int SERVE_TICK_MS = 250;   // signal check interval in `roxy serve`

// ── Buffer sizes ────────────────────────────────────────────
constexpr int MIN_BUFFER_SIZE = 512;
constexpr int MAX_BUFFER_SIZE = 1024 * 1024;
