#pragma once

#include <memory>
#include <vector>

#include <grpcpp/impl/service_type.h>

#include "config/config.pb.h"

namespace fetchgate::core {
class TimeoutSweeper;
class TransferOrchestrator;
}
namespace fetchgate::ingest {
class IngestDispatcher;
}
namespace fetchgate::registry {
class ConnectionRegistry;
}

namespace fetchgate::factory {

/*
  Application

  Owns the long-lived components of the server. The gRPC services hold
  shared references into the same graph and are handed to runtime::Server.
*/
struct Application {
  std::shared_ptr<registry::ConnectionRegistry> registry;
  std::shared_ptr<ingest::IngestDispatcher>     dispatcher;
  std::shared_ptr<core::TransferOrchestrator>   orchestrator;
  std::shared_ptr<core::TimeoutSweeper>         sweeper;

  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;

  // Stops background work once pending events were applied. Call after the
  // gRPC server has stopped so tunnel disconnects are still recorded.
  void Stop();
};

/*
  Build

  Constructs the entire backend based on runtime config.

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete storage types.
*/
Application Build(const fetchgate::runtime::config::RuntimeConfig& config);

} // namespace fetchgate::factory
