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

using narrative::runtime::Server;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "Usage: narrative-curator <config.yaml> OR narrative-curator --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = narrative::config::ConfigLoader::LoadFromYaml(config_path);

    narrative::observability::InitializeTracing(config);
    narrative::observability::InitializeMetrics(config);
    narrative::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = narrative::factory::Build(config);

    // ------------------------------------------------------------
    // Start server
    // ------------------------------------------------------------
    const auto bind_address = config.server().bind_address().empty() ? std::string("0.0.0.0:50061") : config.server().bind_address();
    Server     server(bind_address, std::move(app.grpc_services));

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    NARRATIVE_LOG_INFO("Narrative curator started", {narrative::observability::StringField("bind_address", bind_address)});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    NARRATIVE_LOG_INFO("Shutting down narrative curator");

    server.Stop();
    narrative::observability::ShutdownLogging();
    narrative::observability::ShutdownMetrics();
    narrative::observability::ShutdownTracing();
  } catch (const std::exception& e) {
    NARRATIVE_LOG_ERROR("Fatal error", {narrative::observability::StringField("error", e.what())});
    narrative::observability::ShutdownLogging();
    narrative::observability::ShutdownMetrics();
    narrative::observability::ShutdownTracing();
    return 2;
  }

  return 0;
}
