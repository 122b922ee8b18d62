#pragma once

#include <atomic>
#include <memory>
#include <thread>
#include <vector>

#include "fetch_scheduler.hpp"

namespace localdeck::fetch {

class FallbackFetcher;

/*
  Background pool that performs external retrievals.

  Executes:
      download → ContentStore::Put → settle the shared task
*/
class FetchWorker {
 public:
  FetchWorker(std::shared_ptr<FetchScheduler> scheduler, std::shared_ptr<FallbackFetcher> fetcher, std::size_t threads);
  ~FetchWorker();

  FetchWorker(const FetchWorker&)            = delete;
  FetchWorker& operator=(const FetchWorker&) = delete;

  void Start();

  // Finishes queued tasks, then joins.
  void Stop();

 private:
  void Run();

  std::shared_ptr<FetchScheduler>  scheduler_;
  std::shared_ptr<FallbackFetcher> fetcher_;
  std::size_t                      thread_count_;

  std::vector<std::thread> threads_;
  std::atomic<bool>        running_{false};
};

} // namespace localdeck::fetch
