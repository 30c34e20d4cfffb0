#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "fetchgate/v1/tunnel.grpc.pb.h"

namespace fetchgate::core {
class TransferOrchestrator;
}
namespace fetchgate::registry {
class ConnectionRegistry;
}

namespace fetchgate::grpc {

/*
  Agent side of the data plane.

  Each Connect call is one agent tunnel: a RegisterAgent handshake followed
  by chunks, aborts and heartbeats until the agent hangs up or the server
  closes the session. Messages are demultiplexed here and handed to the
  orchestrator; the handler thread never writes artifacts.
*/
class TunnelServer final : public fetchgate::v1::AgentTunnel::Service {
 public:
  TunnelServer(std::shared_ptr<registry::ConnectionRegistry> registry, std::shared_ptr<core::TransferOrchestrator> orchestrator);

  ::grpc::Status Connect(::grpc::ServerContext* context,
                         ::grpc::ServerReaderWriter<fetchgate::v1::ServerMessage, fetchgate::v1::AgentMessage>* stream) override;

 private:
  std::shared_ptr<registry::ConnectionRegistry> registry_;
  std::shared_ptr<core::TransferOrchestrator>   orchestrator_;
};

} // namespace fetchgate::grpc
