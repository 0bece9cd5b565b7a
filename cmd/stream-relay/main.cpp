#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/config/relay_settings.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/runtime/server.hpp"

using relay::factory::Build;
using relay::runtime::Server;

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
    std::cerr << "Usage: stream-relay <config.yaml> OR stream-relay --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = relay::config::ConfigLoader::LoadFromYaml(config_path);

    relay::observability::InitializeTracing(config);
    relay::observability::InitializeMetrics(config);
    relay::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = Build(config);

    // ------------------------------------------------------------
    // Start server
    // ------------------------------------------------------------
    const auto bind_address = relay::config::DefaultBindAddress(config);
    Server     server(bind_address, std::move(app.grpc_services));

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    RELAY_LOG_INFO("stream relay started", {relay::observability::StringField("bind_address", bind_address)});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    RELAY_LOG_INFO("Shutting down stream relay");

    server.Stop();
    app.Shutdown();
    relay::observability::ShutdownLogging();
    relay::observability::ShutdownMetrics();
    relay::observability::ShutdownTracing();
  } catch (const std::exception& e) {
    RELAY_LOG_ERROR("Fatal error", {relay::observability::StringField("error", e.what())});
    relay::observability::ShutdownLogging();
    relay::observability::ShutdownMetrics();
    relay::observability::ShutdownTracing();
    return 2;
  }

  return 0;
}
