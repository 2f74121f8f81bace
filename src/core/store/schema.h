#pragma once

namespace af {

// Per-connection pragmas, safe on every open. busy_timeout is high because the
// service process and the --ingest CLI may share one database file.
constexpr const char* kConnectionPragmas = R"(
PRAGMA busy_timeout = 30000;
PRAGMA synchronous = NORMAL;
PRAGMA foreign_keys = ON;
PRAGMA wal_autocheckpoint = 1000;
PRAGMA cache_size = -16384;
)";

// Database-level pragmas, run once when creating the DB.
constexpr const char* kDatabasePragmas = R"(
PRAGMA journal_mode = WAL;
PRAGMA application_id = 0x414654;
)";

// Schema v1. Every TTL-bound row carries expires_at_ms; readers ignore
// expired rows and the maintenance pass deletes them.
constexpr const char* kSchemaV1 = R"(
CREATE TABLE IF NOT EXISTS settings (
    key TEXT PRIMARY KEY,
    value TEXT NOT NULL
);

-- Durable per-user event log. seq is global and monotonic, so per-user
-- order is append order.
CREATE TABLE IF NOT EXISTS event_log (
    seq INTEGER PRIMARY KEY AUTOINCREMENT,
    user_id TEXT NOT NULL,
    event_id TEXT NOT NULL,
    event_type TEXT NOT NULL,
    event_json TEXT NOT NULL,
    appended_at_ms INTEGER NOT NULL
);

CREATE INDEX IF NOT EXISTS idx_event_log_user_seq ON event_log(user_id, seq);

CREATE TABLE IF NOT EXISTS event_log_groups (
    user_id TEXT NOT NULL,
    group_name TEXT NOT NULL,
    last_delivered_seq INTEGER NOT NULL DEFAULT 0,
    created_at_ms INTEGER NOT NULL,
    PRIMARY KEY (user_id, group_name)
);

CREATE TABLE IF NOT EXISTS event_log_pending (
    group_name TEXT NOT NULL,
    entry_seq INTEGER NOT NULL,
    user_id TEXT NOT NULL,
    consumer TEXT NOT NULL,
    delivered_at_ms INTEGER NOT NULL,
    delivery_count INTEGER NOT NULL DEFAULT 1,
    PRIMARY KEY (group_name, entry_seq)
);

CREATE INDEX IF NOT EXISTS idx_event_log_pending_user ON event_log_pending(user_id, group_name, entry_seq);

CREATE TABLE IF NOT EXISTS event_log_retries (
    group_name TEXT NOT NULL,
    entry_seq INTEGER NOT NULL,
    retry_count INTEGER NOT NULL DEFAULT 0,
    expires_at_ms INTEGER NOT NULL,
    PRIMARY KEY (group_name, entry_seq)
);

CREATE TABLE IF NOT EXISTS dead_letters (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    user_id TEXT NOT NULL,
    original_message_id TEXT NOT NULL,
    retry_count INTEGER NOT NULL,
    error TEXT NOT NULL,
    failed_at_ms INTEGER NOT NULL,
    event_data TEXT NOT NULL
);

CREATE INDEX IF NOT EXISTS idx_dead_letters_user ON dead_letters(user_id, id DESC);

CREATE TABLE IF NOT EXISTS attempt_threads (
    thread_id TEXT PRIMARY KEY,
    user_id TEXT NOT NULL,
    fingerprint TEXT NOT NULL,
    domain TEXT NOT NULL DEFAULT '',
    attempt_count INTEGER NOT NULL DEFAULT 1,
    status TEXT NOT NULL DEFAULT 'open',
    best_attempt_id TEXT,
    best_reward REAL,
    best_critic_score REAL NOT NULL DEFAULT 0.0,
    best_final_score REAL,
    created_ts_ms INTEGER NOT NULL,
    updated_ts_ms INTEGER NOT NULL,
    expires_at_ms INTEGER NOT NULL,
    UNIQUE (user_id, fingerprint)
);

CREATE INDEX IF NOT EXISTS idx_attempt_threads_expiry ON attempt_threads(expires_at_ms);

-- Index-addressed attempt records: (thread_id, seq). revision is bumped on
-- every rewrite and guards compare-and-swap updates.
CREATE TABLE IF NOT EXISTS attempt_records (
    thread_id TEXT NOT NULL REFERENCES attempt_threads(thread_id) ON DELETE CASCADE,
    seq INTEGER NOT NULL,
    attempt_id TEXT NOT NULL UNIQUE,
    event_id TEXT NOT NULL,
    trace_id TEXT NOT NULL,
    ts_ms INTEGER NOT NULL,
    payload_json TEXT NOT NULL,
    reward REAL NOT NULL DEFAULT 0.0,
    critic_score REAL NOT NULL DEFAULT 0.0,
    outcome TEXT NOT NULL DEFAULT 'unknown',
    revision INTEGER NOT NULL DEFAULT 0,
    PRIMARY KEY (thread_id, seq)
);

CREATE INDEX IF NOT EXISTS idx_attempt_records_trace ON attempt_records(trace_id);

CREATE TABLE IF NOT EXISTS bandit_arms (
    user_id TEXT NOT NULL,
    domain TEXT NOT NULL,
    strategy TEXT NOT NULL,
    shown_count INTEGER NOT NULL DEFAULT 0,
    win_count INTEGER NOT NULL DEFAULT 0,
    expires_at_ms INTEGER NOT NULL,
    PRIMARY KEY (user_id, domain, strategy)
);

CREATE TABLE IF NOT EXISTS policy_patterns (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    user_id TEXT NOT NULL,
    domain TEXT NOT NULL,
    pattern_text TEXT NOT NULL,
    score REAL NOT NULL,
    created_at_ms INTEGER NOT NULL,
    last_used_at_ms INTEGER NOT NULL,
    expires_at_ms INTEGER NOT NULL,
    UNIQUE (user_id, domain, pattern_text)
);

CREATE INDEX IF NOT EXISTS idx_policy_patterns_rank ON policy_patterns(user_id, domain, score DESC);

CREATE TABLE IF NOT EXISTS memory_items (
    memory_id TEXT PRIMARY KEY,
    user_id TEXT NOT NULL,
    memory_key TEXT NOT NULL,
    value TEXT NOT NULL,
    status TEXT NOT NULL DEFAULT 'active',
    superseded_by TEXT,
    created_at_ms INTEGER NOT NULL,
    updated_at_ms INTEGER NOT NULL
);

CREATE INDEX IF NOT EXISTS idx_memory_items_key ON memory_items(user_id, memory_key, status);

CREATE TABLE IF NOT EXISTS safety_counters (
    user_id TEXT NOT NULL,
    category TEXT NOT NULL,
    count INTEGER NOT NULL DEFAULT 0,
    expires_at_ms INTEGER NOT NULL,
    PRIMARY KEY (user_id, category)
);

CREATE TABLE IF NOT EXISTS session_events (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    user_id TEXT NOT NULL,
    provider TEXT NOT NULL,
    event_id TEXT NOT NULL,
    event_type TEXT NOT NULL,
    ts_ms INTEGER NOT NULL,
    expires_at_ms INTEGER NOT NULL
);

CREATE INDEX IF NOT EXISTS idx_session_events_user ON session_events(user_id, provider, id DESC);

CREATE TABLE IF NOT EXISTS session_state (
    user_id TEXT PRIMARY KEY,
    last_event_ts INTEGER NOT NULL,
    last_provider TEXT NOT NULL,
    last_event_type TEXT NOT NULL,
    expires_at_ms INTEGER NOT NULL
);
)";

constexpr const char* kDefaultSettings = R"(
INSERT OR IGNORE INTO settings (key, value) VALUES ('schema_version', '1');
INSERT OR IGNORE INTO settings (key, value) VALUES ('strategy_catalog_version', '0');
)";

constexpr int kCurrentSchemaVersion = 2;

} // namespace af
