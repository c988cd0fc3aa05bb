#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/runtime/server.hpp"

using castproxy::runtime::Server;

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
    std::cerr << "Usage: cast-proxy <config.yaml> OR cast-proxy --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = castproxy::config::ConfigLoader::LoadFromYaml(config_path);

    castproxy::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    Server server(castproxy::factory::Build(config));

    // Register signal handlers before starting to avoid a race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    CASTPROXY_LOG_INFO("cast proxy started", {castproxy::observability::StringField("interface", config.listener().interface_address()),
                                              castproxy::observability::StringField("service", config.discovery().service_name())});

    while (g_running) std::this_thread::sleep_for(std::chrono::milliseconds(200));

    CASTPROXY_LOG_INFO("shutting down cast proxy");

    server.Stop();
    castproxy::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    CASTPROXY_LOG_ERROR("fatal error", {castproxy::observability::StringField("error", e.what())});
    castproxy::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}
