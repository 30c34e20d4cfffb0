#include <unistd.h>

#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "config/config.pb.h"
#include "internal/agent/agent_client.hpp"
#include "internal/observability/logging.hpp"

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

static void Usage() {
  std::cerr << "Usage: fetchgate-agent [--server host:port] [--client-id id] [--chunk-size bytes]" << std::endl;
}

static std::string DefaultClientId() {
  char host[256] = {0};
  if (gethostname(host, sizeof(host) - 1) == 0 && host[0] != '\0') {
    return std::string("agent-") + host;
  }
  return "agent";
}

int main(int argc, char** argv) {
  fetchgate::agent::AgentOptions options;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (i + 1 >= argc) {
      Usage();
      return 1;
    }
    if (arg == "--server") {
      options.server_address = argv[++i];
    } else if (arg == "--client-id") {
      options.agent_id = argv[++i];
    } else if (arg == "--chunk-size") {
      try {
        options.chunk_size_bytes = std::stoull(argv[++i]);
      } catch (const std::exception&) {
        std::cerr << "invalid --chunk-size: " << argv[i] << std::endl;
        return 1;
      }
    } else {
      Usage();
      return 1;
    }
  }
  if (options.agent_id.empty()) {
    options.agent_id = DefaultClientId();
  }

  fetchgate::runtime::config::LoggingConfig logging;
  fetchgate::observability::InitializeLogging(logging, "fetchgate-agent");

  std::signal(SIGINT, HandleSignal);
  std::signal(SIGTERM, HandleSignal);

  FETCHGATE_LOG_INFO("fetchgate agent starting", {fetchgate::observability::StringField("server", options.server_address),
                                                  fetchgate::observability::StringField("client_id", options.agent_id)});

  fetchgate::agent::AgentClient client(options);
  std::thread                   runner([&client] { client.Run(); });

  while (g_running) std::this_thread::sleep_for(std::chrono::milliseconds(200));

  FETCHGATE_LOG_INFO("Shutting down fetchgate agent");
  client.Stop();
  runner.join();
  fetchgate::observability::ShutdownLogging();
  return 0;
}
