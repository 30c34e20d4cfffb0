#include "internal/grpc/tunnel_server.hpp"

#include "internal/core/transfer_orchestrator.hpp"
#include "internal/grpc/grpc_error.hpp"
#include "internal/observability/logging.hpp"
#include "internal/registry/connection_registry.hpp"
#include "internal/tunnel/codec.hpp"
#include "internal/tunnel/grpc_agent_connection.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace fetchgate::grpc {

using namespace fetchgate::v1;
using observability::StringField;

TunnelServer::TunnelServer(std::shared_ptr<registry::ConnectionRegistry> registry, std::shared_ptr<core::TransferOrchestrator> orchestrator)
    : registry_(std::move(registry)), orchestrator_(std::move(orchestrator)) {
}

::grpc::Status TunnelServer::Connect(::grpc::ServerContext* context, ::grpc::ServerReaderWriter<ServerMessage, AgentMessage>* stream) {
  AgentMessage first;
  if (!stream->Read(&first)) {
    return {::grpc::StatusCode::CANCELLED, "tunnel closed before registration"};
  }
  if (first.body_case() != AgentMessage::kRegisterAgent) {
    FETCHGATE_LOG_WARN("Rejecting tunnel without registration", {StringField("peer", context->peer())});
    return {::grpc::StatusCode::INVALID_ARGUMENT, "first tunnel message must be register_agent"};
  }

  try {
    tunnel::ValidateRegister(first.register_agent());
  } catch (const std::exception& e) {
    FETCHGATE_LOG_WARN("Rejecting tunnel registration", {StringField("peer", context->peer()), StringField("error", e.what())});
    return ToStatus(e);
  }

  const auto agent_id   = first.register_agent().agent_id();
  const auto session_id = util::NewId();
  auto       connection = std::make_shared<tunnel::GrpcAgentConnection>(agent_id, session_id, context, stream);

  if (!connection->Send(tunnel::MakeRegistered(session_id, orchestrator_->Settings().chunk_size_bytes))) {
    connection->Detach();
    return {::grpc::StatusCode::CANCELLED, "tunnel closed during registration"};
  }

  FETCHGATE_LOG_DEBUG("Agent handshake accepted", {StringField("agent_id", agent_id), StringField("session_id", session_id),
                                          StringField("agent_version", first.register_agent().agent_version()),
                                          StringField("peer", context->peer())});
  registry_->Register(connection);

  try {
    AgentMessage message;
    while (stream->Read(&message)) {
      registry_->Touch(agent_id, session_id);

      switch (message.body_case()) {
        case AgentMessage::kChunk:
          orchestrator_->OnChunk(agent_id, session_id, std::move(*message.mutable_chunk()));
          break;
        case AgentMessage::kAbort:
          orchestrator_->OnAbort(agent_id, session_id, message.abort());
          break;
        case AgentMessage::kHeartbeat:
          break;
        case AgentMessage::kRegisterAgent:
          FETCHGATE_LOG_WARN("Ignoring repeated registration", {StringField("agent_id", agent_id), StringField("session_id", session_id)});
          break;
        case AgentMessage::BODY_NOT_SET:
          FETCHGATE_LOG_WARN("Ignoring empty tunnel message", {StringField("agent_id", agent_id), StringField("session_id", session_id)});
          break;
      }
      message.Clear();
    }
  } catch (const std::exception& e) {
    FETCHGATE_LOG_ERROR("Tunnel reader failed", {StringField("agent_id", agent_id), StringField("session_id", session_id), StringField("error", e.what())});
  }

  registry_->Deregister(agent_id, session_id);
  connection->Detach();
  return ::grpc::Status::OK;
}

} // namespace fetchgate::grpc
