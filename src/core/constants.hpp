#pragma once

// ── Versioning ──────────────────────────────────────────────
constexpr const char* KEEPSAKE_VERSION       = "0.4.0";
constexpr int CHECKPOINT_FORMAT_VERSION      = 1;
constexpr const char* CHECKPOINT_FILE_NAME   = "session_v1.json";
constexpr const char* LOCK_FILE_NAME         = "keepsake.lock";

// ── Schedule limits ─────────────────────────────────────────
constexpr int MIN_INTERVAL_HOURS             = 1;
constexpr int MAX_INTERVAL_HOURS             = 48;
constexpr int WEEKLY_LOOKAHEAD_DAYS          = 7;     // scan today + 7 days

// ── Log retention ───────────────────────────────────────────
constexpr int DEFAULT_MAX_LOG_LINES          = 10000;
constexpr int LOG_TRIM_BATCH                 = 500;
constexpr int DEFAULT_MAX_ERROR_LINES        = 5000;
constexpr int ERROR_TRIM_BATCH               = 250;
constexpr int DISPLAY_LOG_LINES              = 500;   // tail handed to observers
constexpr int DEFAULT_REFRESH_MS             = 150;   // observer coalescing window

// Per-item progress lines are logged for the first N items, the last one,
// and every Nth after that.
constexpr int PROGRESS_LOG_HEAD              = 25;
constexpr int PROGRESS_LOG_EVERY             = 250;

// ── Platform polling ────────────────────────────────────────
constexpr int WAKE_CHECK_INTERVAL_MS         = 5000;
constexpr int WAKE_GAP_THRESHOLD_SECS        = 30;    // wall-clock jump that counts as sleep
constexpr int SHUTDOWN_POLL_MS               = 100;

// ── Destination layout ──────────────────────────────────────
constexpr const char* DEST_META_DIR          = ".keepsake";
constexpr const char* DEST_MANIFEST_FILE     = "manifest.yaml";
constexpr const char* DEST_TMP_DIR           = "tmp";
