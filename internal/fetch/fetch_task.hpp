#pragma once

#include <chrono>
#include <exception>
#include <future>
#include <string>

#include "source_ref.hpp"

namespace localdeck::fetch {

enum class FetchState {
  kPending,
  kInFlight,
  kDone,
  kFailed,
};

const char* FetchStateName(FetchState state);

/*
  One coalesced retrieval, keyed by canonical source.

  Every caller for the same key shares `future`; it resolves to the
  content ref or rethrows the captured error. Never persisted.
*/
struct FetchTask {
  std::string key;
  SourceRef   source;

  FetchState         state = FetchState::kPending;
  std::string        result_ref;
  std::exception_ptr error;

  std::chrono::steady_clock::time_point created_at;
  std::chrono::steady_clock::time_point finished_at;

  std::promise<std::string>       promise;
  std::shared_future<std::string> future;
};

} // namespace localdeck::fetch
