#include "touch_worker.hpp"

#include "internal/observability/logging.hpp"
#include "track_registry.hpp"

namespace localdeck::registry {

using localdeck::observability::StringField;

TouchWorker::TouchWorker(std::shared_ptr<TouchScheduler> scheduler, std::shared_ptr<TrackRegistry> registry)
    : scheduler_(std::move(scheduler)), registry_(std::move(registry)) {
}

TouchWorker::~TouchWorker() {
  Stop();
}

void TouchWorker::Start() {
  if (thread_.joinable()) return;
  thread_ = std::thread(&TouchWorker::Run, this);
}

void TouchWorker::Stop() {
  scheduler_->Shutdown();
  if (thread_.joinable()) thread_.join();
}

void TouchWorker::Run() {
  while (auto task = scheduler_->Dequeue()) {
    try {
      if (!registry_->Touch(task->card_id, task->played_at_ms)) {
        LOCALDECK_LOG_WARN("touch skipped, card not mapped", {StringField("card_id", task->card_id)});
      }
    } catch (const std::exception& e) {
      LOCALDECK_LOG_WARN("touch failed", {StringField("card_id", task->card_id), StringField("error", e.what())});
    }
  }
}

} // namespace localdeck::registry
