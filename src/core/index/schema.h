#pragma once

namespace rp {

// Per-connection pragmas, applied on every open.
// Bulk runs open one connection per worker, so busy_timeout is high enough
// to wait out another worker's candidate commit.
constexpr const char* kConnectionPragmas = R"(
PRAGMA busy_timeout = 30000;
PRAGMA synchronous = NORMAL;
PRAGMA foreign_keys = ON;
PRAGMA wal_autocheckpoint = 10000;
PRAGMA cache_size = -65536;
PRAGMA journal_size_limit = 33554432;
)";

// Database-level pragmas. Need the write lock; run once when creating the DB.
constexpr const char* kDatabasePragmas = R"(
PRAGMA journal_mode = WAL;
PRAGMA application_id = 0x52504B;
PRAGMA user_version = 1;
)";

// Schema v1 CREATE statements
constexpr const char* kSchemaV1 = R"(
CREATE TABLE IF NOT EXISTS settings (
    key TEXT PRIMARY KEY,
    value TEXT NOT NULL
);

CREATE TABLE IF NOT EXISTS users (
    id TEXT PRIMARY KEY,
    name TEXT NOT NULL DEFAULT '',
    is_enabled INTEGER NOT NULL DEFAULT 1,
    max_parental_rating INTEGER
);

CREATE TABLE IF NOT EXISTS library_config (
    library_id TEXT PRIMARY KEY,
    name TEXT NOT NULL DEFAULT '',
    media_type TEXT NOT NULL,
    is_enabled INTEGER NOT NULL DEFAULT 1
);

CREATE TABLE IF NOT EXISTS parental_rating_values (
    rating TEXT PRIMARY KEY,
    value INTEGER NOT NULL
);

CREATE TABLE IF NOT EXISTS items (
    id INTEGER PRIMARY KEY,
    title TEXT NOT NULL,
    year INTEGER NOT NULL DEFAULT 0,
    media_type TEXT NOT NULL,
    genres TEXT NOT NULL DEFAULT '[]',
    franchise TEXT,
    community_rating REAL,
    popularity REAL NOT NULL DEFAULT 0,
    official_rating TEXT,
    library_id TEXT
);

CREATE INDEX IF NOT EXISTS idx_items_media_type ON items(media_type);
CREATE INDEX IF NOT EXISTS idx_items_library ON items(library_id);
CREATE INDEX IF NOT EXISTS idx_items_franchise ON items(franchise);

CREATE TABLE IF NOT EXISTS item_embeddings (
    item_id INTEGER NOT NULL REFERENCES items(id) ON DELETE CASCADE,
    model_id TEXT NOT NULL,
    dimensions INTEGER NOT NULL,
    embedding BLOB NOT NULL,
    updated_at REAL NOT NULL,
    PRIMARY KEY (item_id, model_id)
);

CREATE TABLE IF NOT EXISTS watch_history (
    user_id TEXT NOT NULL REFERENCES users(id) ON DELETE CASCADE,
    item_id INTEGER NOT NULL REFERENCES items(id) ON DELETE CASCADE,
    play_count INTEGER NOT NULL DEFAULT 1,
    last_played_at REAL NOT NULL DEFAULT 0,
    is_favorite INTEGER NOT NULL DEFAULT 0,
    user_rating REAL,
    completion REAL NOT NULL DEFAULT 1.0,
    episodes_watched INTEGER NOT NULL DEFAULT 0,
    PRIMARY KEY (user_id, item_id)
);

CREATE INDEX IF NOT EXISTS idx_watch_history_user ON watch_history(user_id, last_played_at DESC);

CREATE TABLE IF NOT EXISTS taste_profiles (
    user_id TEXT NOT NULL REFERENCES users(id) ON DELETE CASCADE,
    media_type TEXT NOT NULL,
    embedding BLOB,
    embedding_model TEXT,
    dimensions INTEGER NOT NULL DEFAULT 0,
    is_locked INTEGER NOT NULL DEFAULT 0,
    refresh_interval_days INTEGER NOT NULL DEFAULT 7,
    min_franchise_items INTEGER NOT NULL DEFAULT 2,
    min_franchise_size INTEGER NOT NULL DEFAULT 2,
    auto_updated_at REAL NOT NULL DEFAULT 0,
    user_modified_at REAL NOT NULL DEFAULT 0,
    PRIMARY KEY (user_id, media_type)
);

CREATE TABLE IF NOT EXISTS franchise_preferences (
    user_id TEXT NOT NULL REFERENCES users(id) ON DELETE CASCADE,
    franchise_name TEXT NOT NULL,
    media_type TEXT NOT NULL DEFAULT 'both',
    preference_score REAL NOT NULL DEFAULT 0,
    items_watched INTEGER NOT NULL DEFAULT 0,
    total_engagement REAL NOT NULL DEFAULT 0,
    is_user_set INTEGER NOT NULL DEFAULT 0,
    updated_at REAL NOT NULL,
    PRIMARY KEY (user_id, franchise_name, media_type)
);

CREATE TABLE IF NOT EXISTS genre_weights (
    user_id TEXT NOT NULL REFERENCES users(id) ON DELETE CASCADE,
    genre TEXT NOT NULL,
    weight REAL NOT NULL DEFAULT 1.0,
    is_user_set INTEGER NOT NULL DEFAULT 0,
    updated_at REAL NOT NULL,
    PRIMARY KEY (user_id, genre)
);

CREATE TABLE IF NOT EXISTS custom_interests (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    user_id TEXT NOT NULL REFERENCES users(id) ON DELETE CASCADE,
    media_type TEXT NOT NULL,
    interest_text TEXT NOT NULL,
    embedding BLOB,
    embedding_model TEXT,
    created_at REAL NOT NULL
);

CREATE TABLE IF NOT EXISTS recommendation_runs (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    user_id TEXT NOT NULL,
    media_type TEXT NOT NULL,
    run_type TEXT NOT NULL,
    channel_id TEXT,
    status TEXT NOT NULL,
    candidate_count INTEGER NOT NULL DEFAULT 0,
    selected_count INTEGER NOT NULL DEFAULT 0,
    duration_ms INTEGER NOT NULL DEFAULT 0,
    error_message TEXT,
    created_at REAL NOT NULL,
    completed_at REAL
);

CREATE INDEX IF NOT EXISTS idx_runs_user ON recommendation_runs(user_id, media_type, created_at DESC);

CREATE TABLE IF NOT EXISTS recommendation_candidates (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    run_id INTEGER NOT NULL REFERENCES recommendation_runs(id) ON DELETE CASCADE,
    item_id INTEGER NOT NULL,
    rank INTEGER NOT NULL DEFAULT 0,
    is_selected INTEGER NOT NULL DEFAULT 0,
    similarity REAL NOT NULL,
    novelty REAL NOT NULL,
    rating_score REAL NOT NULL,
    diversity_penalty REAL NOT NULL DEFAULT 0,
    diversity_score REAL NOT NULL DEFAULT 1,
    base_score REAL NOT NULL,
    final_score REAL NOT NULL,
    UNIQUE (run_id, item_id)
);

CREATE INDEX IF NOT EXISTS idx_candidates_run ON recommendation_candidates(run_id, is_selected, rank);

CREATE TABLE IF NOT EXISTS recommendation_evidence (
    id INTEGER PRIMARY KEY AUTOINCREMENT,
    candidate_id INTEGER NOT NULL REFERENCES recommendation_candidates(id) ON DELETE CASCADE,
    similar_item_id INTEGER NOT NULL,
    similarity REAL NOT NULL,
    evidence_type TEXT NOT NULL
);

CREATE INDEX IF NOT EXISTS idx_evidence_candidate ON recommendation_evidence(candidate_id);
)";

// Default settings inserted on first DB creation
constexpr const char* kDefaultSettings = R"(
INSERT OR IGNORE INTO settings (key, value) VALUES
    ('schema_version', '1'),
    ('last_bulk_run_at', '0');
)";

constexpr int kCurrentSchemaVersion = 3;

} // namespace rp
