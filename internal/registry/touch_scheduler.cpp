#include "touch_scheduler.hpp"

namespace localdeck::registry {

bool TouchScheduler::Enqueue(TouchTask task) {
  {
    std::lock_guard lock(mutex_);
    if (shutdown_) return false;
    queue_.push(std::move(task));
  }
  cv_.notify_one();
  return true;
}

std::optional<TouchTask> TouchScheduler::Dequeue() {
  std::unique_lock lock(mutex_);

  cv_.wait(lock, [&] { return shutdown_ || !queue_.empty(); });

  if (queue_.empty()) return std::nullopt;

  TouchTask task = std::move(queue_.front());
  queue_.pop();
  return task;
}

void TouchScheduler::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
}

size_t TouchScheduler::Depth() const {
  std::lock_guard lock(mutex_);
  return queue_.size();
}

} // namespace localdeck::registry
