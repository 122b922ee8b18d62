#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace localdeck::db::sqlite {

class SqliteRepository final : public db::Repository {
 public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;

  std::optional<model::TrackRecord> GetTrack(Transaction&, const std::string& card_id) override;
  std::vector<model::TrackRecord>   ListTracks(Transaction&) override;
  Result                            UpsertTrack(Transaction&, const model::TrackRecord&) override;
  Result                            TouchTrack(Transaction&, const std::string& card_id, uint64_t played_at_ms) override;
  uint64_t                          CountTracksByContent(Transaction&, const std::string& content_ref) override;

 private:
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result             Translate(sqlite3* db, int rc);
};

} // namespace localdeck::db::sqlite
