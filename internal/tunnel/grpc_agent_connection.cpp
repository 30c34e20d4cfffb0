#include "internal/tunnel/grpc_agent_connection.hpp"

#include "internal/observability/logging.hpp"

namespace fetchgate::tunnel {

GrpcAgentConnection::GrpcAgentConnection(std::string agent_id, std::string session_id, ::grpc::ServerContext* context, TunnelStream* stream)
    : agent_id_(std::move(agent_id)), session_id_(std::move(session_id)), context_(context), stream_(stream) {
}

bool GrpcAgentConnection::Send(const fetchgate::v1::ServerMessage& message) {
  std::lock_guard<std::mutex> lock(write_mutex_);
  if (closed_.load() || stream_ == nullptr) {
    return false;
  }
  if (!stream_->Write(message)) {
    closed_.store(true);
    return false;
  }
  return true;
}

void GrpcAgentConnection::Close(std::string_view reason) {
  if (closed_.exchange(true)) {
    return;
  }

  FETCHGATE_LOG_INFO("Closing agent tunnel", {observability::StringField("agent_id", agent_id_), observability::StringField("session_id", session_id_),
                                              observability::StringField("reason", reason)});

  std::lock_guard<std::mutex> lock(context_mutex_);
  if (context_ != nullptr) {
    context_->TryCancel();
  }
}

bool GrpcAgentConnection::IsClosed() const {
  return closed_.load();
}

void GrpcAgentConnection::Detach() {
  closed_.store(true);
  {
    std::lock_guard<std::mutex> lock(context_mutex_);
    context_ = nullptr;
  }
  std::lock_guard<std::mutex> lock(write_mutex_);
  stream_ = nullptr;
}

} // namespace fetchgate::tunnel
