#pragma once

namespace localdeck::db::sql {

/*
  Canonical SQL used by the SQL backends.

  Written in the SQLite dialect; ON CONFLICT upserts need SQLite >= 3.24.
*/

static constexpr const char* CREATE_SCHEMA_MIGRATIONS =
    "CREATE TABLE IF NOT EXISTS tracks_schema_migrations ("
    " version INTEGER PRIMARY KEY,"
    " applied_at_ms INTEGER NOT NULL);";

static constexpr const char* SELECT_SCHEMA_VERSION = "SELECT COALESCE(MAX(version), 0) FROM tracks_schema_migrations;";

static constexpr const char* INSERT_SCHEMA_VERSION = "INSERT INTO tracks_schema_migrations(version, applied_at_ms) VALUES(?,?);";

// tracks

static constexpr const char* CREATE_TRACKS =
    "CREATE TABLE IF NOT EXISTS tracks ("
    " card_id TEXT PRIMARY KEY,"
    " content_ref TEXT,"
    " source_ref TEXT,"
    " created_at_ms INTEGER NOT NULL,"
    " updated_at_ms INTEGER NOT NULL,"
    " last_played_at_ms INTEGER NOT NULL DEFAULT 0);";

static constexpr const char* CREATE_TRACKS_CONTENT_INDEX = "CREATE INDEX IF NOT EXISTS tracks_content_ref_idx ON tracks(content_ref);";

static constexpr const char* SELECT_TRACK =
    "SELECT card_id,content_ref,source_ref,created_at_ms,updated_at_ms,last_played_at_ms"
    " FROM tracks WHERE card_id=?;";

static constexpr const char* SELECT_TRACKS =
    "SELECT card_id,content_ref,source_ref,created_at_ms,updated_at_ms,last_played_at_ms"
    " FROM tracks ORDER BY card_id;";

static constexpr const char* UPSERT_TRACK =
    "INSERT INTO tracks(card_id,content_ref,source_ref,created_at_ms,updated_at_ms,last_played_at_ms)"
    " VALUES(?,?,?,?,?,?)"
    " ON CONFLICT(card_id) DO UPDATE SET"
    " content_ref=excluded.content_ref,"
    " source_ref=excluded.source_ref,"
    " updated_at_ms=excluded.updated_at_ms;";

static constexpr const char* TOUCH_TRACK = "UPDATE tracks SET last_played_at_ms=? WHERE card_id=?;";

static constexpr const char* COUNT_TRACKS_BY_CONTENT = "SELECT COUNT(*) FROM tracks WHERE content_ref=?;";

} // namespace localdeck::db::sql
