#include "fetch_scheduler.hpp"

namespace localdeck::fetch {

bool FetchScheduler::Enqueue(std::shared_ptr<FetchTask> task) {
  {
    std::lock_guard lock(mutex_);
    if (shutdown_) return false;
    queue_.push(std::move(task));
  }
  cv_.notify_one();
  return true;
}

std::optional<std::shared_ptr<FetchTask>> FetchScheduler::Dequeue() {
  std::unique_lock lock(mutex_);

  cv_.wait(lock, [&] { return shutdown_ || !queue_.empty(); });

  if (shutdown_ && queue_.empty()) return std::nullopt;

  auto task = std::move(queue_.front());
  queue_.pop();
  return task;
}

void FetchScheduler::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
}

std::size_t FetchScheduler::Depth() const {
  std::lock_guard lock(mutex_);
  return queue_.size();
}

} // namespace localdeck::fetch
