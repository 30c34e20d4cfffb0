#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/config/settings.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/registry/connection_registry.hpp"
#include "internal/runtime/server.hpp"

using fetchgate::runtime::Server;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 1) {
    // defaults only
  } else if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "Usage: fetchgate-server [<config.yaml> | --config <config.yaml>]" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    fetchgate::runtime::config::RuntimeConfig config;
    if (!config_path.empty()) {
      config = fetchgate::config::ConfigLoader::LoadFromYaml(config_path);
    }

    fetchgate::observability::InitializeTracing(config);
    fetchgate::observability::InitializeMetrics(config);
    fetchgate::observability::InitializeLogging(config.logging(), "fetchgate-server");

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app          = fetchgate::factory::Build(config);
    auto bind_address = fetchgate::config::ResolveBindAddress(config);

    // ------------------------------------------------------------
    // Start server
    // ------------------------------------------------------------
    Server server(bind_address, std::move(app.grpc_services));

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();
    FETCHGATE_LOG_INFO("fetchgate server started", {fetchgate::observability::StringField("bind_address", bind_address)});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    FETCHGATE_LOG_INFO("Shutting down fetchgate server");

    app.registry->CloseAll("server shutting down");
    server.Stop();
    app.Stop();
    fetchgate::observability::ShutdownLogging();
    fetchgate::observability::ShutdownMetrics();
    fetchgate::observability::ShutdownTracing();
  } catch (const std::exception& e) {
    FETCHGATE_LOG_ERROR("Fatal error", {fetchgate::observability::StringField("error", e.what())});
    fetchgate::observability::ShutdownLogging();
    fetchgate::observability::ShutdownMetrics();
    fetchgate::observability::ShutdownTracing();
    return 2;
  }

  return 0;
}
