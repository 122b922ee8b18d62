#pragma once

#include <memory>
#include <string>

namespace localdeck::core {
class ResolutionEngine;
}
namespace localdeck::playback {
class PlaybackController;
}
namespace localdeck::registry {
class TrackRegistry;
}
namespace localdeck::storage {
class ContentStore;
}

namespace localdeck::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<localdeck::core::ResolutionEngine>     resolver;
  std::shared_ptr<localdeck::playback::PlaybackController> playback;
  std::shared_ptr<localdeck::registry::TrackRegistry>    registry;
  std::shared_ptr<localdeck::storage::ContentStore>      store;
  // base of the URL printed on cards
  std::string public_base_url;
};

} // namespace localdeck::service
