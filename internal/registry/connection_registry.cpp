#include "internal/registry/connection_registry.hpp"

#include <algorithm>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

namespace fetchgate::registry {

using observability::StringField;

void ConnectionRegistry::SetListener(LivenessListener listener) {
  std::lock_guard lock(listener_mutex_);
  listener_ = std::move(listener);
}

tunnel::AgentConnectionPtr ConnectionRegistry::Register(tunnel::AgentConnectionPtr connection) {
  const auto agent_id   = connection->AgentId();
  const auto session_id = connection->SessionId();
  const auto now        = util::Now();

  tunnel::AgentConnectionPtr previous;
  std::size_t                size = 0;
  {
    std::unique_lock lock(mutex_);
    auto&            entry = agents_[agent_id];
    previous               = std::move(entry.connection);
    entry.connection       = std::move(connection);
    entry.connected_at     = now;
    entry.last_seen        = now;
    size                   = agents_.size();
  }

  observability::Metrics::Instance().SetConnectedAgents(size);

  if (previous) {
    FETCHGATE_LOG_WARN("Agent connection replaced", {StringField("agent_id", agent_id), StringField("old_session_id", previous->SessionId()),
                                                     StringField("session_id", session_id)});
    previous->Close("connection replaced");
    Emit({LivenessEvent::Kind::kReplaced, agent_id, previous->SessionId()});
  }

  FETCHGATE_LOG_INFO("Agent connected", {StringField("agent_id", agent_id), StringField("session_id", session_id)});
  Emit({LivenessEvent::Kind::kConnected, agent_id, session_id});
  return previous;
}

bool ConnectionRegistry::Deregister(const std::string& agent_id, const std::string& session_id) {
  std::size_t size = 0;
  {
    std::unique_lock lock(mutex_);
    auto             it = agents_.find(agent_id);
    if (it == agents_.end() || it->second.connection->SessionId() != session_id) {
      return false;
    }
    agents_.erase(it);
    size = agents_.size();
  }

  observability::Metrics::Instance().SetConnectedAgents(size);
  FETCHGATE_LOG_INFO("Agent disconnected", {StringField("agent_id", agent_id), StringField("session_id", session_id)});
  Emit({LivenessEvent::Kind::kDisconnected, agent_id, session_id});
  return true;
}

tunnel::AgentConnectionPtr ConnectionRegistry::Lookup(const std::string& agent_id) const {
  std::shared_lock lock(mutex_);
  auto             it = agents_.find(agent_id);
  if (it == agents_.end()) return nullptr;
  return it->second.connection;
}

void ConnectionRegistry::Touch(const std::string& agent_id, const std::string& session_id) {
  const auto       now = util::Now();
  std::unique_lock lock(mutex_);
  auto             it = agents_.find(agent_id);
  if (it != agents_.end() && it->second.connection->SessionId() == session_id) {
    it->second.last_seen = now;
  }
}

std::vector<AgentInfo> ConnectionRegistry::List() const {
  std::vector<AgentInfo> agents;
  {
    std::shared_lock lock(mutex_);
    agents.reserve(agents_.size());
    for (const auto& [agent_id, entry] : agents_) {
      agents.push_back({agent_id, entry.connection->SessionId(), Liveness::kConnected, entry.connected_at, entry.last_seen});
    }
  }
  std::sort(agents.begin(), agents.end(), [](const AgentInfo& a, const AgentInfo& b) { return a.agent_id < b.agent_id; });
  return agents;
}

std::size_t ConnectionRegistry::Size() const {
  std::shared_lock lock(mutex_);
  return agents_.size();
}

void ConnectionRegistry::CloseAll(std::string_view reason) {
  std::vector<tunnel::AgentConnectionPtr> connections;
  {
    std::shared_lock lock(mutex_);
    for (const auto& [agent_id, entry] : agents_) {
      connections.push_back(entry.connection);
    }
  }
  for (const auto& connection : connections) {
    connection->Close(reason);
  }
}

void ConnectionRegistry::Emit(const LivenessEvent& event) {
  LivenessListener listener;
  {
    std::lock_guard lock(listener_mutex_);
    listener = listener_;
  }
  if (listener) {
    listener(event);
  }
}

} // namespace fetchgate::registry
