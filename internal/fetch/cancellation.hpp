#pragma once

#include <atomic>
#include <functional>
#include <utility>

namespace localdeck::fetch {

/*
  Caller-owned cancellation flag.

  Cancelling only releases the caller's own wait; shared work keeps running.
  An optional probe links the token to an outside signal such as a client
  disconnect.
*/
class CancellationToken {
 public:
  CancellationToken() = default;
  explicit CancellationToken(std::function<bool()> probe) : probe_(std::move(probe)) {
  }

  void Cancel() {
    cancelled_.store(true, std::memory_order_release);
  }

  bool IsCancelled() const {
    return cancelled_.load(std::memory_order_acquire) || (probe_ && probe_());
  }

 private:
  std::atomic<bool>     cancelled_{false};
  std::function<bool()> probe_;
};

} // namespace localdeck::fetch
