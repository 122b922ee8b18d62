#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <stdexcept>

#include "internal/db/sql/sql_queries.hpp"

namespace localdeck::db::sqlite {

using localdeck::db::ErrorCode;
using localdeck::db::Result;

static void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

// Empty strings are stored as NULL.
static void BindOptionalText(sqlite3_stmt* st, int idx, const std::optional<std::string>& s) {
  if (!s.has_value() || s->empty()) {
    sqlite3_bind_null(st, idx);
    return;
  }
  BindText(st, idx, *s);
}

static void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

static std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

static std::optional<std::string> ColOptionalText(sqlite3_stmt* st, int col) {
  if (sqlite3_column_type(st, col) == SQLITE_NULL) return std::nullopt;
  return ColText(st, col);
}

static uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

static model::TrackRecord ReadTrack(sqlite3_stmt* st) {
  model::TrackRecord r;
  r.card_id           = ColText(st, 0);
  r.content_ref       = ColText(st, 1);
  r.source_ref        = ColOptionalText(st, 2);
  r.created_at_ms     = ColU64(st, 3);
  r.updated_at_ms     = ColU64(st, 4);
  r.last_played_at_ms = ColU64(st, 5);
  return r;
}

static sqlite3_stmt* PrepareOrThrow(sqlite3* db, const char* sql) {
  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) {
    throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db));
  }
  return st;
}

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc & 0xFF) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
    case SQLITE_FULL:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
    case SQLITE_NOTADB:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

std::optional<model::TrackRecord> SqliteRepository::GetTrack(Transaction& t, const std::string& card_id) {
  auto* db = TX(t).Handle();
  auto* st = PrepareOrThrow(db, sql::SELECT_TRACK);

  BindText(st, 1, card_id);

  int rc = sqlite3_step(st);
  if (rc != SQLITE_ROW) {
    sqlite3_finalize(st);
    if (rc != SQLITE_DONE) {
      throw std::runtime_error(std::string("sqlite get track: ") + sqlite3_errmsg(db));
    }
    return std::nullopt;
  }

  auto r = ReadTrack(st);
  sqlite3_finalize(st);
  return r;
}

std::vector<model::TrackRecord> SqliteRepository::ListTracks(Transaction& t) {
  auto* db = TX(t).Handle();
  auto* st = PrepareOrThrow(db, sql::SELECT_TRACKS);

  std::vector<model::TrackRecord> out;
  int                             rc = SQLITE_OK;
  while ((rc = sqlite3_step(st)) == SQLITE_ROW) {
    out.push_back(ReadTrack(st));
  }
  sqlite3_finalize(st);

  if (rc != SQLITE_DONE) {
    throw std::runtime_error(std::string("sqlite list tracks: ") + sqlite3_errmsg(db));
  }
  return out;
}

Result SqliteRepository::UpsertTrack(Transaction& t, const model::TrackRecord& r) {
  if (r.card_id.empty()) return Result::Err(ErrorCode::ConstraintViolation, "card_id must not be empty");

  auto*         db = TX(t).Handle();
  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql::UPSERT_TRACK, -1, &st, nullptr) != SQLITE_OK) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindText(st, 1, r.card_id);
  BindOptionalText(st, 2, r.content_ref);
  BindOptionalText(st, 3, r.source_ref);
  BindU64(st, 4, r.created_at_ms);
  BindU64(st, 5, r.updated_at_ms);
  BindU64(st, 6, r.last_played_at_ms);

  int rc = sqlite3_step(st);
  sqlite3_finalize(st);

  return Translate(db, rc);
}

Result SqliteRepository::TouchTrack(Transaction& t, const std::string& card_id, uint64_t played_at_ms) {
  auto*         db = TX(t).Handle();
  sqlite3_stmt* st = nullptr;
  if (sqlite3_prepare_v2(db, sql::TOUCH_TRACK, -1, &st, nullptr) != SQLITE_OK) return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

  BindU64(st, 1, played_at_ms);
  BindText(st, 2, card_id);

  int rc = sqlite3_step(st);
  sqlite3_finalize(st);

  auto result = Translate(db, rc);
  if (result && sqlite3_changes(db) == 0) {
    return Result::Err(ErrorCode::NotFound, "track not found");
  }
  return result;
}

uint64_t SqliteRepository::CountTracksByContent(Transaction& t, const std::string& content_ref) {
  auto* db = TX(t).Handle();
  auto* st = PrepareOrThrow(db, sql::COUNT_TRACKS_BY_CONTENT);

  BindText(st, 1, content_ref);

  int      rc    = sqlite3_step(st);
  uint64_t count = rc == SQLITE_ROW ? ColU64(st, 0) : 0;
  sqlite3_finalize(st);

  if (rc != SQLITE_ROW) {
    throw std::runtime_error(std::string("sqlite count tracks: ") + sqlite3_errmsg(db));
  }
  return count;
}

} // namespace localdeck::db::sqlite
