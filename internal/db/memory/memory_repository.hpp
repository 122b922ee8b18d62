#pragma once

#include <cstdint>
#include <mutex>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace localdeck::db::memory {

class MemoryTransaction;

/*
  In-process repository for tests and ephemeral decks.

  Transactions work on a snapshot copy and publish it on Commit().
  A commit fails if another transaction committed after the snapshot was taken.
*/
class MemoryRepository final : public db::Repository {
 public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  std::optional<model::TrackRecord> GetTrack(Transaction&, const std::string& card_id) override;
  std::vector<model::TrackRecord>   ListTracks(Transaction&) override;
  Result                            UpsertTrack(Transaction&, const model::TrackRecord&) override;
  Result                            TouchTrack(Transaction&, const std::string& card_id, uint64_t played_at_ms) override;
  uint64_t                          CountTracksByContent(Transaction&, const std::string& content_ref) override;

 private:
  friend class MemoryTransaction;

  struct State {
    std::unordered_map<std::string, model::TrackRecord> tracks;
  };

  static MemoryTransaction& TX(Transaction& t);

  std::mutex mutex_;
  State      committed_;
  uint64_t   committed_version_ = 0;
};

} // namespace localdeck::db::memory
