#pragma once

#include <grpcpp/grpcpp.h>
#include <grpcpp/support/sync_stream.h>

#include <atomic>
#include <mutex>
#include <string>

#include "fetchgate/v1/tunnel.pb.h"
#include "internal/tunnel/agent_connection.hpp"

namespace fetchgate::tunnel {

using TunnelStream = ::grpc::ServerReaderWriter<fetchgate::v1::ServerMessage, fetchgate::v1::AgentMessage>;

/*
  AgentConnection over the server half of an AgentTunnel.Connect stream.

  The context and stream pointers are owned by gRPC and only valid while the
  Connect handler runs. The handler calls Detach() before returning; later
  sends fail instead of touching the stream.
*/
class GrpcAgentConnection final : public AgentConnection {
 public:
  GrpcAgentConnection(std::string agent_id, std::string session_id, ::grpc::ServerContext* context, TunnelStream* stream);

  const std::string& AgentId() const override {
    return agent_id_;
  }
  const std::string& SessionId() const override {
    return session_id_;
  }

  bool Send(const fetchgate::v1::ServerMessage& message) override;
  void Close(std::string_view reason) override;
  bool IsClosed() const override;

  void Detach();

 private:
  const std::string agent_id_;
  const std::string session_id_;

  // Writes are serialized on write_mutex_. The context has its own lock so a
  // Close() can cancel a Write() blocked on flow control.
  std::mutex             write_mutex_;
  std::mutex             context_mutex_;
  ::grpc::ServerContext* context_;
  TunnelStream*          stream_;
  std::atomic<bool>      closed_{false};
};

} // namespace fetchgate::tunnel
