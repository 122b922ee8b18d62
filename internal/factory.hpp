#pragma once

#include <grpcpp/impl/service_type.h>

#include <memory>
#include <vector>

#include "config/config.pb.h"

namespace localdeck::fetch {
class AudioSource;
class FetchWorker;
} // namespace localdeck::fetch
namespace localdeck::playback {
class AudioSink;
class PlaybackController;
} // namespace localdeck::playback
namespace localdeck::registry {
class TouchWorker;
}
namespace localdeck::service {
class DeckService;
}

namespace localdeck::factory {

/*
  Application

  Owns every long-lived component of a running deck. Workers are started
  by Build and stopped by Shutdown (or on destruction).
*/
struct Application {
  Application() = default;
  ~Application();

  Application(Application&&)            = default;
  Application& operator=(Application&&) = default;

  // Halts playback, then drains and joins the background workers.
  void Shutdown();

  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;

  std::shared_ptr<localdeck::service::DeckService>        deck_service;
  std::shared_ptr<localdeck::playback::PlaybackController> playback;
  std::shared_ptr<localdeck::fetch::FetchWorker>          fetch_worker;
  std::shared_ptr<localdeck::registry::TouchWorker>       touch_worker;
};

// Optional replacements for the external edges, used by tests.
struct Overrides {
  std::shared_ptr<localdeck::fetch::AudioSource>  audio_source;
  std::shared_ptr<localdeck::playback::AudioSink> audio_sink;
};

/*
  Build

  Constructs the entire backend from runtime config.

  This is the composition root of the application and the only place
  that knows concrete store, repository, source and sink types.
*/
Application Build(const localdeck::runtime::config::RuntimeConfig& config, const Overrides& overrides = {});

} // namespace localdeck::factory
