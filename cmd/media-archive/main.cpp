#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/runtime/server.hpp"

using archive::runtime::Server;

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
    std::cerr << "Usage: media-archive <config.yaml> OR media-archive --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = archive::config::ConfigLoader::LoadFromYaml(config_path);

    archive::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = archive::factory::Build(config);

    // ------------------------------------------------------------
    // Start server
    // ------------------------------------------------------------
    Server server(config.server().bind_address(), std::move(app.grpc_services));

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    ARCHIVE_LOG_INFO("media archive started", {archive::observability::StringField("bind_address", config.server().bind_address()),
                                               archive::observability::UintField("total_items", app.registry->TotalItems())});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    ARCHIVE_LOG_INFO("Shutting down media archive");

    server.Stop();
    archive::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    ARCHIVE_LOG_ERROR("Fatal error", {archive::observability::StringField("error", e.what())});
    archive::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}
