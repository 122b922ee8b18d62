#pragma once

#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <queue>

#include "fetch_task.hpp"

namespace localdeck::fetch {

/*
  Thread-safe blocking queue for fetch workers.
*/
class FetchScheduler {
 public:
  // false once Shutdown() was called; the task is not queued.
  bool Enqueue(std::shared_ptr<FetchTask> task);

  // blocking wait; drains the queue before reporting shutdown
  std::optional<std::shared_ptr<FetchTask>> Dequeue();

  void Shutdown();

  std::size_t Depth() const;

 private:
  mutable std::mutex                     mutex_;
  std::condition_variable                cv_;
  std::queue<std::shared_ptr<FetchTask>> queue_;
  bool                                   shutdown_ = false;
};

} // namespace localdeck::fetch
