#pragma once

namespace keysync::db::sql {

/*
  Canonical SQL for the Keymapp store.

  IMPORTANT:
  The CREATE TABLE text is what the desktop application itself writes.
  Table names, column names, types and constraints must not change.
*/

static constexpr const char* CREATE_CONFIG = R"SQL(CREATE TABLE IF NOT EXISTS "config" (
            key TEXT,
            value TEXT
        );)SQL";

static constexpr const char* CREATE_METADATA = R"SQL(CREATE TABLE IF NOT EXISTS "metadata" (
            data BLOB
        );)SQL";

static constexpr const char* CREATE_HEATMAP = R"SQL(CREATE TABLE IF NOT EXISTS "heatmap" (
            revisionId TEXT NOT NULL UNIQUE,
            enabled boolean DEFAULT 0,
            data BLOB DEFAULT NULL
        );)SQL";

static constexpr const char* CREATE_REVISION = R"SQL(CREATE TABLE IF NOT EXISTS "revision" (
            revisionId TEXT NOT NULL UNIQUE,
            data BLOB DEFAULT NULL
        );)SQL";

static constexpr const char* CREATE_SMART_LAYER = R"SQL(CREATE TABLE IF NOT EXISTS "smart_layer" (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            app TEXT NOT NULL,
            layer INTEGER NOT NULL,
            layoutId TEXT NOT NULL,
            revisionId TEXT NOT NULL
        );)SQL";

static constexpr const char* CREATE_AUTH = R"SQL(CREATE TABLE IF NOT EXISTS "auth" (
            token TEXT NOT NULL UNIQUE,
            username TEXT NOT NULL
        );)SQL";

// config

static constexpr const char* COUNT_CONFIG_KEY =
    "SELECT count(*) FROM config WHERE key=?;";

static constexpr const char* INSERT_CONFIG =
    "INSERT INTO config (key, value) VALUES (?, ?);";

static constexpr const char* SELECT_CONFIG_VALUE =
    "SELECT value FROM config WHERE key=? LIMIT 1;";

static constexpr const char* SELECT_CONFIG =
    "SELECT key, value FROM config ORDER BY rowid;";

// metadata

static constexpr const char* COUNT_METADATA =
    "SELECT count(*) FROM metadata;";

static constexpr const char* INSERT_METADATA =
    "INSERT INTO metadata (data) VALUES (?);";

static constexpr const char* SELECT_METADATA =
    "SELECT data FROM metadata ORDER BY rowid LIMIT 1;";

// revision

static constexpr const char* UPSERT_REVISION =
    "INSERT INTO revision (revisionId, data) VALUES (?, ?)"
    " ON CONFLICT(revisionId) DO UPDATE SET data=excluded.data;";

static constexpr const char* SELECT_REVISION =
    "SELECT revisionId, data FROM revision WHERE revisionId=?;";

static constexpr const char* COUNT_REVISION =
    "SELECT count(*) FROM revision;";

} // namespace keysync::db::sql
