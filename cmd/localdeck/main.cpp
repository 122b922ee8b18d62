#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/runtime/server.hpp"

using localdeck::observability::StringField;
using localdeck::runtime::Server;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

static void ShutdownObservability() {
  localdeck::observability::ShutdownLogging();
  localdeck::observability::ShutdownMetrics();
  localdeck::observability::ShutdownTracing();
}

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "Usage: localdeck <config.yaml> OR localdeck --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = localdeck::config::ConfigLoader::LoadFromYaml(config_path);

    localdeck::observability::InitializeTracing(config);
    localdeck::observability::InitializeMetrics(config);
    localdeck::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = localdeck::factory::Build(config);

    const auto bind_address = config.server().bind_address().empty() ? std::string("0.0.0.0:50061") : config.server().bind_address();

    // ------------------------------------------------------------
    // Start server
    // ------------------------------------------------------------
    Server server(bind_address, std::move(app.grpc_services));

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    LOCALDECK_LOG_INFO("localdeck started", {StringField("bind_address", bind_address)});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    LOCALDECK_LOG_INFO("Shutting down localdeck");

    server.Stop();
    app.Shutdown();
    ShutdownObservability();
  } catch (const std::exception& e) {
    LOCALDECK_LOG_ERROR("Fatal error", {StringField("error", e.what())});
    ShutdownObservability();
    return 2;
  }

  return 0;
}
