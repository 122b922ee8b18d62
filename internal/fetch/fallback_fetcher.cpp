#include "fallback_fetcher.hpp"

#include <stdexcept>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"

namespace localdeck::fetch {

using localdeck::observability::IntField;
using localdeck::observability::StringField;

namespace {

constexpr auto kCancelPollInterval = std::chrono::milliseconds(20);

// Anything that is not already a fetch error kind is reported as the source failing.
std::exception_ptr NormalizeError(std::exception_ptr error) {
  try {
    std::rethrow_exception(error);
  } catch (const localdeck::util::SourceUnavailable&) {
    return error;
  } catch (const localdeck::util::UnsupportedSource&) {
    return error;
  } catch (const localdeck::util::StorageError&) {
    return error;
  } catch (const std::exception& e) {
    return std::make_exception_ptr(localdeck::util::SourceUnavailable(e.what()));
  }
  return error;
}

std::string Describe(const std::exception_ptr& error) {
  try {
    std::rethrow_exception(error);
  } catch (const std::exception& e) {
    return e.what();
  }
  return "unknown error";
}

double ElapsedMs(std::chrono::steady_clock::time_point since) {
  return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - since).count();
}

} // namespace

const char* FetchStateName(FetchState state) {
  switch (state) {
    case FetchState::kPending:
      return "pending";
    case FetchState::kInFlight:
      return "in_flight";
    case FetchState::kDone:
      return "done";
    case FetchState::kFailed:
      return "failed";
  }
  return "unknown";
}

FallbackFetcher::FallbackFetcher(std::shared_ptr<AudioSource> source, localdeck::storage::ContentStorePtr store,
                                 std::shared_ptr<FetchScheduler> scheduler, std::chrono::milliseconds failure_cooldown)
    : source_(std::move(source)), store_(std::move(store)), scheduler_(std::move(scheduler)), failure_cooldown_(failure_cooldown) {
  if (!source_ || !store_ || !scheduler_) {
    throw std::invalid_argument("fallback fetcher requires a source, a content store and a scheduler");
  }
}

std::shared_ptr<FetchTask> FallbackFetcher::NewTask(const SourceRef& source) {
  auto task        = std::make_shared<FetchTask>();
  task->key        = source.Key();
  task->source     = source;
  task->created_at = std::chrono::steady_clock::now();
  task->future     = task->promise.get_future().share();
  return task;
}

FetchResult FallbackFetcher::Fetch(const std::string& source_hint, const CancellationToken* cancel) {
  const auto source = ParseSourceRef(source_hint);
  const auto key    = source.Key();

  std::shared_ptr<FetchTask> task;
  bool                       created = false;
  FetchState                 joined  = FetchState::kPending;
  while (!task) {
    std::shared_ptr<FetchTask> memo;
    {
      std::lock_guard lock(mutex_);
      auto            it = tasks_.find(key);
      if (it != tasks_.end()) {
        const auto& existing = it->second;
        switch (existing->state) {
          case FetchState::kDone:
            memo = existing;
            break;
          case FetchState::kFailed:
            if (std::chrono::steady_clock::now() - existing->finished_at < failure_cooldown_) {
              localdeck::observability::Metrics::Instance().RecordFetch("cooldown");
              std::rethrow_exception(existing->error);
            }
            tasks_.erase(it);
            break;
          case FetchState::kPending:
          case FetchState::kInFlight:
            task   = existing;
            joined = existing->state;
            break;
        }
      }

      if (!memo && !task) {
        task    = NewTask(source);
        created = true;
        tasks_.emplace(key, task);
      }
    }

    if (!memo) break;

    // result_ref of a settled task never changes; check the store without the table lock
    if (store_->Exists(memo->result_ref)) {
      localdeck::observability::Metrics::Instance().RecordFetch("memo");
      return FetchResult{memo->result_ref, source};
    }
    LOCALDECK_LOG_WARN("fetch memo points at missing content; refetching", {StringField("source", key), StringField("content_ref", memo->result_ref)});

    std::lock_guard lock(mutex_);
    auto            it = tasks_.find(key);
    if (it != tasks_.end() && it->second == memo) {
      tasks_.erase(it);
    }
  }

  if (created) {
    LOCALDECK_LOG_INFO("fetch scheduled", {StringField("source", key)});
    if (!scheduler_->Enqueue(task)) {
      Fail(task, std::make_exception_ptr(localdeck::util::SourceUnavailable("fetcher is shutting down")));
    }
  } else {
    LOCALDECK_LOG_DEBUG("fetch coalesced", {StringField("source", key), StringField("state", FetchStateName(joined))});
    localdeck::observability::Metrics::Instance().RecordFetch("coalesced");
  }

  return FetchResult{Await(task->future, key, cancel), source};
}

std::string FallbackFetcher::Await(const std::shared_future<std::string>& future, const std::string& key, const CancellationToken* cancel) {
  if (cancel == nullptr) {
    return future.get();
  }

  while (future.wait_for(kCancelPollInterval) != std::future_status::ready) {
    if (cancel->IsCancelled()) {
      throw localdeck::util::Cancelled("fetch wait cancelled for " + key);
    }
  }
  return future.get();
}

void FallbackFetcher::Execute(const std::shared_ptr<FetchTask>& task) {
  {
    std::lock_guard lock(mutex_);
    task->state = FetchState::kInFlight;
  }

  localdeck::observability::SpanScope span("FallbackFetcher.Execute");
  span.SetAttribute("fetch.source", task->key);

  const auto started_at = std::chrono::steady_clock::now();
  try {
    auto bytes       = source_->Retrieve(task->source);
    auto content_ref = store_->Put(bytes);

    LOCALDECK_LOG_INFO("fetch complete", {StringField("source", task->key), StringField("content_ref", content_ref),
                                          IntField("bytes", bytes->size()), IntField("duration_ms", static_cast<int64_t>(ElapsedMs(started_at)))});
    localdeck::observability::Metrics::Instance().ObserveFetchDurationMs("done", ElapsedMs(started_at));
    Settle(task, std::move(content_ref));
  } catch (const std::exception& e) {
    span.RecordException(e.what());
    auto error = NormalizeError(std::current_exception());
    LOCALDECK_LOG_ERROR("fetch failed", {StringField("source", task->key), StringField("error", Describe(error))});
    localdeck::observability::Metrics::Instance().ObserveFetchDurationMs("failed", ElapsedMs(started_at));
    Fail(task, std::move(error));
  }
}

void FallbackFetcher::Settle(const std::shared_ptr<FetchTask>& task, std::string content_ref) {
  {
    std::lock_guard lock(mutex_);
    task->state       = FetchState::kDone;
    task->result_ref  = content_ref;
    task->finished_at = std::chrono::steady_clock::now();
  }
  localdeck::observability::Metrics::Instance().RecordFetch("done");
  task->promise.set_value(std::move(content_ref));
}

void FallbackFetcher::Fail(const std::shared_ptr<FetchTask>& task, std::exception_ptr error) {
  {
    std::lock_guard lock(mutex_);
    task->state       = FetchState::kFailed;
    task->error       = error;
    task->finished_at = std::chrono::steady_clock::now();
  }
  localdeck::observability::Metrics::Instance().RecordFetch("failed");
  task->promise.set_exception(std::move(error));
}

std::optional<FetchTaskInfo> FallbackFetcher::Inspect(const std::string& key) const {
  std::lock_guard lock(mutex_);
  auto            it = tasks_.find(key);
  if (it == tasks_.end()) return std::nullopt;
  return FetchTaskInfo{it->second->key, it->second->state, it->second->result_ref};
}

std::size_t FallbackFetcher::InFlightCount() const {
  std::lock_guard lock(mutex_);
  std::size_t     count = 0;
  for (const auto& [key, task] : tasks_) {
    if (task->state == FetchState::kPending || task->state == FetchState::kInFlight) ++count;
  }
  return count;
}

} // namespace localdeck::fetch
