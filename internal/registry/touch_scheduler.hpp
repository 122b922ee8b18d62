#pragma once

#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <queue>
#include <string>

namespace localdeck::registry {

struct TouchTask {
  std::string card_id;
  uint64_t    played_at_ms{0};
};

/*
  Thread-safe blocking queue of last-played updates.

  Resolve enqueues and returns; a TouchWorker applies the updates
  off the playback path.
*/
class TouchScheduler {
 public:
  // false once shut down
  bool Enqueue(TouchTask task);

  // blocking wait; drains remaining tasks after shutdown
  std::optional<TouchTask> Dequeue();

  void Shutdown();

  size_t Depth() const;

 private:
  mutable std::mutex      mutex_;
  std::condition_variable cv_;
  std::queue<TouchTask>   queue_;
  bool                    shutdown_ = false;
};

} // namespace localdeck::registry
