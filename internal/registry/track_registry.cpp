#include "track_registry.hpp"

#include <stdexcept>
#include <type_traits>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace localdeck::registry {

using localdeck::db::model::TrackRecord;

namespace {

void ThrowIfDbError(const localdeck::db::Result& result, const std::string& context) {
  if (result) {
    return;
  }

  const auto message = result.message.empty() ? context : context + ": " + result.message;
  switch (result.code) {
    case localdeck::db::ErrorCode::ConstraintViolation:
      throw localdeck::util::InvalidArgument(message);
    default:
      throw localdeck::util::StorageError(message);
  }
}

} // namespace

TrackRegistry::TrackRegistry(std::shared_ptr<localdeck::db::Repository> repository, bool cache_enabled)
    : repository_(std::move(repository)), cache_enabled_(cache_enabled) {
  if (!repository_) {
    throw std::invalid_argument("track registry requires a repository");
  }
}

template <typename Fn>
auto TrackRegistry::RunInTransaction(const char* context, Fn&& fn) {
  std::lock_guard lock(tx_mutex_);
  try {
    auto tx = repository_->Begin();
    if constexpr (std::is_void_v<std::invoke_result_t<Fn, localdeck::db::Transaction&>>) {
      fn(*tx);
    } else {
      return fn(*tx);
    }
  } catch (const localdeck::util::StorageError&) {
    throw;
  } catch (const localdeck::util::InvalidArgument&) {
    throw;
  } catch (const std::exception& e) {
    throw localdeck::util::StorageError(std::string(context) + ": " + e.what());
  }
}

void TrackRegistry::CacheRecord(const TrackRecord& record) {
  if (!cache_enabled_) {
    return;
  }
  std::unique_lock lock(cache_mutex_);
  cache_[record.card_id] = record;
}

std::optional<TrackRecord> TrackRegistry::Lookup(const std::string& card_id) {
  if (cache_enabled_) {
    std::shared_lock lock(cache_mutex_);
    auto             it = cache_.find(card_id);
    if (it != cache_.end()) {
      return it->second;
    }
  }

  return RunInTransaction("lookup track", [&](localdeck::db::Transaction& tx) {
    auto found = repository_->GetTrack(tx, card_id);
    tx.Commit();
    if (found.has_value()) {
      CacheRecord(*found);
    }
    return found;
  });
}

TrackRecord TrackRegistry::Upsert(const std::string& card_id, const std::string& content_ref, const std::optional<std::string>& source_ref) {
  if (card_id.empty()) {
    throw localdeck::util::InvalidArgument("upsert track: card id must not be empty");
  }

  const auto now = localdeck::util::NowMillis();

  TrackRecord candidate;
  candidate.card_id       = card_id;
  candidate.content_ref   = content_ref;
  candidate.source_ref    = source_ref;
  candidate.created_at_ms = now;
  candidate.updated_at_ms = now;

  auto stored = RunInTransaction("upsert track", [&](localdeck::db::Transaction& tx) {
    ThrowIfDbError(repository_->UpsertTrack(tx, candidate), "upsert track");
    auto written = repository_->GetTrack(tx, card_id);
    if (!written.has_value()) {
      throw localdeck::util::StorageError("upsert track: record missing after write");
    }
    tx.Commit();
    CacheRecord(*written);
    return *written;
  });

  LOCALDECK_LOG_INFO("track mapped", {localdeck::observability::StringField("card_id", card_id),
                                      localdeck::observability::StringField("content_ref", content_ref),
                                      localdeck::observability::StringField("source_ref", source_ref.value_or(""))});
  return stored;
}

bool TrackRegistry::Touch(const std::string& card_id, uint64_t played_at_ms) {
  const auto now = played_at_ms != 0 ? played_at_ms : localdeck::util::NowMillis();

  return RunInTransaction("touch track", [&](localdeck::db::Transaction& tx) {
    auto result = repository_->TouchTrack(tx, card_id, now);
    if (result.code == localdeck::db::ErrorCode::NotFound) {
      tx.Rollback();
      return false;
    }
    ThrowIfDbError(result, "touch track");
    tx.Commit();

    if (cache_enabled_) {
      std::unique_lock lock(cache_mutex_);
      auto             it = cache_.find(card_id);
      if (it != cache_.end()) {
        it->second.last_played_at_ms = now;
      }
    }
    return true;
  });
}

std::vector<TrackRecord> TrackRegistry::List() {
  return RunInTransaction("list tracks", [&](localdeck::db::Transaction& tx) {
    auto records = repository_->ListTracks(tx);
    tx.Commit();
    return records;
  });
}

uint64_t TrackRegistry::ReferenceCount(const std::string& content_ref) {
  if (content_ref.empty()) {
    return 0;
  }
  return RunInTransaction("count tracks", [&](localdeck::db::Transaction& tx) {
    auto count = repository_->CountTracksByContent(tx, content_ref);
    tx.Commit();
    return count;
  });
}

std::size_t TrackRegistry::HydrateCache() {
  if (!cache_enabled_) {
    return 0;
  }

  return RunInTransaction("hydrate cache", [&](localdeck::db::Transaction& tx) {
    auto records = repository_->ListTracks(tx);
    tx.Commit();

    std::unique_lock lock(cache_mutex_);
    cache_.clear();
    for (const auto& record : records) {
      cache_[record.card_id] = record;
    }
    return records.size();
  });
}

} // namespace localdeck::registry
