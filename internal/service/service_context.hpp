#pragma once

#include <memory>

namespace fetchgate::core {
class TransferOrchestrator;
}
namespace fetchgate::registry {
class ConnectionRegistry;
}

namespace fetchgate::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<fetchgate::registry::ConnectionRegistry> registry;
  std::shared_ptr<fetchgate::core::TransferOrchestrator>   orchestrator;
};

} // namespace fetchgate::service
