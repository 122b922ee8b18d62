#pragma once

#include <memory>
#include <thread>

#include "touch_scheduler.hpp"

namespace localdeck::registry {

class TrackRegistry;

/*
  Background worker that records last-played timestamps.

  Failures are logged and dropped; a missed touch never affects playback.
*/
class TouchWorker {
 public:
  TouchWorker(std::shared_ptr<TouchScheduler> scheduler, std::shared_ptr<TrackRegistry> registry);
  ~TouchWorker();

  void Start();
  // Applies queued touches, then joins.
  void Stop();

 private:
  void Run();

  std::shared_ptr<TouchScheduler> scheduler_;
  std::shared_ptr<TrackRegistry>  registry_;

  std::thread thread_;
};

} // namespace localdeck::registry
