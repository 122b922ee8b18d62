#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/track_record.hpp"

namespace localdeck::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All reads and writes run inside a Transaction
  - Reads inside a transaction see its writes
  - UpsertTrack never rewrites created_at_ms or last_played_at_ms
    of an existing row

  The DB is the source of truth for card → content mappings.
*/

class Repository {
 public:
  virtual ~Repository() = default;

  virtual std::unique_ptr<Transaction> Begin() = 0;

  virtual std::optional<model::TrackRecord> GetTrack(Transaction&, const std::string& card_id) = 0;

  virtual std::vector<model::TrackRecord> ListTracks(Transaction&) = 0;

  // Insert, or replace content_ref/source_ref/updated_at_ms of an existing row.
  virtual Result UpsertTrack(Transaction&, const model::TrackRecord&) = 0;

  // ErrorCode::NotFound when the card has no row.
  virtual Result TouchTrack(Transaction&, const std::string& card_id, uint64_t played_at_ms) = 0;

  virtual uint64_t CountTracksByContent(Transaction&, const std::string& content_ref) = 0;
};

} // namespace localdeck::db
