#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/observability/logging.hpp"
#include "internal/runtime/application.hpp"
#include "internal/runtime/server.hpp"

using gencore::runtime::BuildApplication;
using gencore::runtime::Server;

static constexpr const char* kDefaultBindAddress = "0.0.0.0:50061";

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
    std::cerr << "Usage: gencore <config.yaml> OR gencore --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = gencore::config::ConfigLoader::LoadFromYaml(config_path);

    gencore::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph, taxonomy bootstrap)
    // ------------------------------------------------------------
    auto app = BuildApplication(config);

    // ------------------------------------------------------------
    // Start server
    // ------------------------------------------------------------
    const std::string bind_address = config.server().bind_address().empty() ? kDefaultBindAddress : config.server().bind_address();
    Server server(bind_address, std::move(app.grpc_services));

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    GENCORE_LOG_INFO("gencore started", {gencore::observability::StringField("bind_address", bind_address)});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    GENCORE_LOG_INFO("Shutting down gencore");

    server.Stop();
    gencore::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    GENCORE_LOG_ERROR("Fatal error", {gencore::observability::StringField("error", e.what())});
    gencore::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}
