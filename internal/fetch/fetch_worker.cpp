#include "fetch_worker.hpp"

#include "fallback_fetcher.hpp"
#include "internal/observability/logging.hpp"

namespace localdeck::fetch {

FetchWorker::FetchWorker(std::shared_ptr<FetchScheduler> scheduler, std::shared_ptr<FallbackFetcher> fetcher, std::size_t threads)
    : scheduler_(std::move(scheduler)), fetcher_(std::move(fetcher)), thread_count_(threads == 0 ? 1 : threads) {
}

FetchWorker::~FetchWorker() {
  Stop();
}

void FetchWorker::Start() {
  if (running_.exchange(true)) return;
  for (std::size_t i = 0; i < thread_count_; ++i) {
    threads_.emplace_back(&FetchWorker::Run, this);
  }
  LOCALDECK_LOG_INFO("fetch workers started", {localdeck::observability::IntField("threads", static_cast<int64_t>(thread_count_))});
}

void FetchWorker::Stop() {
  scheduler_->Shutdown();
  running_ = false;
  for (auto& thread : threads_) {
    if (thread.joinable()) thread.join();
  }
  threads_.clear();
}

void FetchWorker::Run() {
  for (;;) {
    auto task = scheduler_->Dequeue();
    if (!task) break;

    // Execute settles the task itself, success or failure
    fetcher_->Execute(*task);
  }
}

} // namespace localdeck::fetch
