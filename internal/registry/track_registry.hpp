#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/model/track_record.hpp"

namespace localdeck::registry {

/*
  Durable card → content mapping.

  The repository is authoritative. A read-through cache of records keeps
  repeat taps off the database; it is refreshed only after a successful
  commit, so a failed write never leaves a cached mapping behind.

  Repository failures surface as util::StorageError.
*/
class TrackRegistry {
 public:
  explicit TrackRegistry(std::shared_ptr<localdeck::db::Repository> repository, bool cache_enabled = true);

  std::optional<localdeck::db::model::TrackRecord> Lookup(const std::string& card_id);

  // Last writer wins. created_at and last_played_at of an existing record are kept.
  localdeck::db::model::TrackRecord Upsert(const std::string& card_id, const std::string& content_ref,
                                           const std::optional<std::string>& source_ref);

  // Records a playback start at played_at_ms (0: now). Returns false, and
  // changes nothing, for an unknown card.
  bool Touch(const std::string& card_id, uint64_t played_at_ms = 0);

  std::vector<localdeck::db::model::TrackRecord> List();

  // Number of cards currently pointing at content_ref.
  uint64_t ReferenceCount(const std::string& content_ref);

  // Loads every record into the cache. Returns the number loaded.
  std::size_t HydrateCache();

 private:
  template <typename Fn>
  auto RunInTransaction(const char* context, Fn&& fn);

  void CacheRecord(const localdeck::db::model::TrackRecord& record);

  std::shared_ptr<localdeck::db::Repository> repository_;
  const bool                                 cache_enabled_;

  // One repository transaction at a time; the SQLite backend shares one connection.
  // Cache writes happen under it too, so the cache follows commit order.
  std::mutex tx_mutex_;

  mutable std::shared_mutex                                         cache_mutex_;
  std::unordered_map<std::string, localdeck::db::model::TrackRecord> cache_;
};

} // namespace localdeck::registry
