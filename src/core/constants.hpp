#pragma once

// ── File names ──────────────────────────────────────────────
constexpr const char* PROFILES_FILENAME     = "ktun-profiles.yaml";
constexpr const char* STATE_FILENAME        = "state.json";
constexpr const char* LOCK_FILENAME         = ".lock";
constexpr const char* PROFILE_STATE_DIRNAME = ".ktun";
constexpr const char* KUBECONFIG_ORIG       = "kubeconfig.orig";
constexpr const char* KUBECONFIG_LOCAL      = "kubeconfig.local";

// ── Environment ─────────────────────────────────────────────
constexpr const char* ENV_PROFILE   = "KTUN_PROFILE";
constexpr const char* ENV_STATE_DIR = "KTUN_STATE_DIR";
constexpr const char* ENV_LOG_FILE  = "KTUN_LOG_FILE";
constexpr const char* DEFAULT_PROFILE = "default";

// ── Locking ─────────────────────────────────────────────────
constexpr int LOCK_TIMEOUT_MS       = 5000;   // Max wait for the state lock
constexpr int LOCK_POLL_MS          = 50;     // Retry interval while the lock is held elsewhere

// ── Tunnels ─────────────────────────────────────────────────
constexpr int LOCAL_PORT_MIN        = 10000;  // Random local port range (inclusive)
constexpr int LOCAL_PORT_MAX        = 20000;
constexpr int TERMINATE_GRACE_MS    = 2000;   // SIGTERM → SIGKILL escalation for our own children
constexpr const char* KUBERNETES_FORWARDING = "kubernetes";

// ── API server readiness ────────────────────────────────────
constexpr int API_GRACE_FRESH_SECS  = 30;     // Tunnel was just (re)started
constexpr int API_GRACE_REUSED_SECS = 2;      // Existing tunnel or direct connection
constexpr int API_PROBE_INTERVAL_MS = 1000;
constexpr int API_PROBE_TIMEOUT_MS  = 2000;   // Upper bound for a single attempt
constexpr int DEFAULT_API_PORT      = 443;

// ── SSH (kubeconfig fetch) ──────────────────────────────────
constexpr int SSH_PORT              = 22;
constexpr int SSH_CONNECT_TIMEOUT_SECS = 30;
constexpr int SSH_READ_BUF_SIZE     = 4096;

constexpr const char* KTUN_VERSION = "0.2.0";
