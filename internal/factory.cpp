#include "factory.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "internal/core/resolution_engine.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_migrations.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/fetch/fallback_fetcher.hpp"
#include "internal/fetch/fetch_scheduler.hpp"
#include "internal/fetch/fetch_worker.hpp"
#include "internal/fetch/ytdlp_audio_source.hpp"
#include "internal/grpc/deck_server.hpp"
#include "internal/observability/logging.hpp"
#include "internal/playback/playback_controller.hpp"
#include "internal/playback/process_audio_sink.hpp"
#include "internal/registry/touch_scheduler.hpp"
#include "internal/registry/touch_worker.hpp"
#include "internal/registry/track_registry.hpp"
#include "internal/service/deck_service.hpp"
#include "internal/service/service_context.hpp"
#include "internal/storage/storage_factory.hpp"
#include "internal/util/time.hpp"

namespace localdeck::factory {

using namespace localdeck;
using localdeck::observability::IntField;
using localdeck::observability::StringField;

namespace {

constexpr auto        kDefaultFailureCooldown = std::chrono::seconds(30);
constexpr auto        kDefaultStopTimeout     = std::chrono::seconds(2);
constexpr std::size_t kDefaultFetchWorkers    = 2;
constexpr const char* kDefaultSqlitePath      = "/tmp/localdeck/localdeck.db";

std::shared_ptr<db::Repository> BuildRepository(const localdeck::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_memory()) {
    return std::make_shared<db::memory::MemoryRepository>();
  }

  const auto path      = database.sqlite().path().empty() ? std::string(kDefaultSqlitePath) : database.sqlite().path();
  const bool wal_mode  = !database.has_sqlite() || database.sqlite().wal_mode();
  auto       sqlite_db = std::make_shared<db::sqlite::SqliteDB>(path, wal_mode);
  const int  applied   = db::sqlite::ApplySchema(sqlite_db);
  LOCALDECK_LOG_INFO("sqlite repository ready", {StringField("path", path), IntField("migrations_applied", applied)});
  return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
}

std::shared_ptr<fetch::AudioSource> BuildAudioSource(const localdeck::runtime::config::FetchConfig& cfg) {
  fetch::YtDlpOptions options;
  options.executable   = cfg.ytdlp_path();
  options.audio_format = cfg.audio_format();
  options.extra_args.assign(cfg.extra_args().begin(), cfg.extra_args().end());
  options.work_dir = cfg.work_dir();
  return std::make_shared<fetch::YtDlpAudioSource>(std::move(options));
}

std::shared_ptr<playback::AudioSink> BuildAudioSink(const localdeck::runtime::config::PlaybackConfig& cfg) {
  std::vector<std::string> command(cfg.player_command().begin(), cfg.player_command().end());
  if (command.empty()) {
    command = {"ffplay", "-nodisp", "-autoexit", "-loglevel", "error", "-"};
  }
  return std::make_shared<playback::ProcessAudioSink>(std::move(command), util::ToMillis(cfg.stop_timeout(), kDefaultStopTimeout));
}

} // namespace

Application::~Application() {
  Shutdown();
}

void Application::Shutdown() {
  if (playback) {
    playback->Stop();
  }
  if (fetch_worker) {
    fetch_worker->Stop();
  }
  if (touch_worker) {
    touch_worker->Stop();
  }
}

/*
    Build full application dependency graph
*/
Application Build(const localdeck::runtime::config::RuntimeConfig& config, const Overrides& overrides) {
  Application app;

  // ------------------------------------------------------------------
  // Storage
  // ------------------------------------------------------------------
  auto store      = storage::StorageFactory::Build(config.content());
  auto repository = BuildRepository(config);

  const bool cache_enabled = !config.has_registry() || config.registry().cache_enabled();
  auto       registry      = std::make_shared<registry::TrackRegistry>(repository, cache_enabled);
  if (cache_enabled) {
    registry->HydrateCache();
  }

  // ------------------------------------------------------------------
  // Background work
  // ------------------------------------------------------------------
  auto touch_scheduler = std::make_shared<registry::TouchScheduler>();
  app.touch_worker     = std::make_shared<registry::TouchWorker>(touch_scheduler, registry);
  app.touch_worker->Start();

  auto source          = overrides.audio_source ? overrides.audio_source : BuildAudioSource(config.fetch());
  auto fetch_scheduler = std::make_shared<fetch::FetchScheduler>();
  auto fetcher         = std::make_shared<fetch::FallbackFetcher>(source, store, fetch_scheduler,
                                                                  util::ToMillis(config.fetch().failure_cooldown(), kDefaultFailureCooldown));

  const std::size_t workers = config.fetch().workers() > 0 ? config.fetch().workers() : kDefaultFetchWorkers;
  app.fetch_worker          = std::make_shared<fetch::FetchWorker>(fetch_scheduler, fetcher, workers);
  app.fetch_worker->Start();

  // ------------------------------------------------------------------
  // Core components
  // ------------------------------------------------------------------
  auto resolver = std::make_shared<core::ResolutionEngine>(registry, store, fetcher, touch_scheduler);
  auto sink     = overrides.audio_sink ? overrides.audio_sink : BuildAudioSink(config.playback());
  app.playback  = std::make_shared<playback::PlaybackController>(store, sink);

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.resolver        = resolver;
  ctx.playback        = app.playback;
  ctx.registry        = registry;
  ctx.store           = store;
  ctx.public_base_url = config.public_endpoint().base_url();

  app.deck_service = std::make_shared<service::DeckService>(ctx);

  // ------------------------------------------------------------------
  // gRPC servers
  // ------------------------------------------------------------------
  app.grpc_services.push_back(std::make_unique<grpc::DeckServer>(app.deck_service));

  LOCALDECK_LOG_INFO("deck assembled", {IntField("fetch_workers", static_cast<int64_t>(workers)), StringField("cache", cache_enabled ? "on" : "off")});
  return app;
}

} // namespace localdeck::factory
