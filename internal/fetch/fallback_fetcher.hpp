#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "audio_source.hpp"
#include "cancellation.hpp"
#include "fetch_scheduler.hpp"
#include "fetch_task.hpp"
#include "internal/storage/content_store.hpp"

namespace localdeck::fetch {

struct FetchResult {
  std::string content_ref;
  SourceRef   source;
};

struct FetchTaskInfo {
  std::string key;
  FetchState  state = FetchState::kPending;
  std::string result_ref;
};

/*
  Acquires audio for a fallback hint, at most once per source.

  Tasks are keyed by canonical source, not by card: two cards printed
  with the same video share one download and one content ref.

  - Pending/InFlight: callers attach to the running task
  - Done: memoized for the process lifetime, revalidated against the store
  - Failed: the same error is returned until failure_cooldown elapses,
    then the next caller starts a fresh attempt

  The table lock covers state transitions only; retrieval and storage
  run on fetch workers without it.
*/
class FallbackFetcher {
 public:
  FallbackFetcher(std::shared_ptr<AudioSource> source, localdeck::storage::ContentStorePtr store, std::shared_ptr<FetchScheduler> scheduler,
                  std::chrono::milliseconds failure_cooldown);

  /*
    Blocks until the shared fetch settles.

    Throws util::UnsupportedSource, util::SourceUnavailable or
    util::StorageError exactly as the shared task failed, and
    util::Cancelled if `cancel` fires first.
  */
  FetchResult Fetch(const std::string& source_hint, const CancellationToken* cancel = nullptr);

  // Runs one task to completion. Called by FetchWorker.
  void Execute(const std::shared_ptr<FetchTask>& task);

  std::optional<FetchTaskInfo> Inspect(const std::string& key) const;

  std::size_t InFlightCount() const;

 private:
  std::shared_ptr<FetchTask> NewTask(const SourceRef& source);

  void Settle(const std::shared_ptr<FetchTask>& task, std::string content_ref);
  void Fail(const std::shared_ptr<FetchTask>& task, std::exception_ptr error);

  static std::string Await(const std::shared_future<std::string>& future, const std::string& key, const CancellationToken* cancel);

  std::shared_ptr<AudioSource>        source_;
  localdeck::storage::ContentStorePtr store_;
  std::shared_ptr<FetchScheduler>     scheduler_;
  std::chrono::milliseconds           failure_cooldown_;

  mutable std::mutex                                          mutex_;
  std::unordered_map<std::string, std::shared_ptr<FetchTask>> tasks_;
};

} // namespace localdeck::fetch
