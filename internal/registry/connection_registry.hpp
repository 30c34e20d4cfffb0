#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "internal/tunnel/agent_connection.hpp"
#include "internal/util/time.hpp"

namespace fetchgate::registry {

enum class Liveness : std::uint8_t {
  kConnected,
  kDisconnected,
};

struct AgentInfo {
  std::string     agent_id;
  std::string     session_id;
  Liveness        liveness = Liveness::kConnected;
  util::TimePoint connected_at{};
  util::TimePoint last_seen{};
};

struct LivenessEvent {
  enum class Kind : std::uint8_t {
    kConnected,
    // The session was superseded by a newer registration of the same agent.
    kReplaced,
    kDisconnected,
  };

  Kind        kind;
  std::string agent_id;
  std::string session_id;
};

using LivenessListener = std::function<void(const LivenessEvent&)>;

/*
  Live agent tunnels keyed by agent id.

  At most one connection per agent. A newer registration replaces and closes
  the older one. Deregistration is bound to a session so a late disconnect of
  a replaced tunnel cannot remove its successor.

  Listener callbacks run on the caller's thread after the registry lock has
  been released.
*/
class ConnectionRegistry {
 public:
  void SetListener(LivenessListener listener);

  // Returns the connection that was replaced, if any. It has been closed.
  tunnel::AgentConnectionPtr Register(tunnel::AgentConnectionPtr connection);

  // false when the session is not the current one for the agent.
  bool Deregister(const std::string& agent_id, const std::string& session_id);

  tunnel::AgentConnectionPtr Lookup(const std::string& agent_id) const;

  void Touch(const std::string& agent_id, const std::string& session_id);

  std::vector<AgentInfo> List() const;
  std::size_t            Size() const;

  // Closes every tunnel; used on shutdown.
  void CloseAll(std::string_view reason);

 private:
  struct Entry {
    tunnel::AgentConnectionPtr connection;
    util::TimePoint            connected_at{};
    util::TimePoint            last_seen{};
  };

  void Emit(const LivenessEvent& event);

  mutable std::shared_mutex              mutex_;
  std::unordered_map<std::string, Entry> agents_;

  std::mutex       listener_mutex_;
  LivenessListener listener_;
};

} // namespace fetchgate::registry
