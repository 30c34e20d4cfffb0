#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>

#include <grpcpp/grpcpp.h>

namespace fetchgate::agent {

struct AgentOptions {
  std::string               server_address{"localhost:50051"};
  std::string               agent_id;
  std::uint64_t             chunk_size_bytes{1024 * 1024};
  std::chrono::milliseconds reconnect_delay{5000};
  std::chrono::milliseconds heartbeat_interval{15000};
  // Files streamed at once. Further requests wait in the sender queue.
  std::size_t send_workers{4};
};

/*
  Reference agent.

  Holds one tunnel to the server, hands every TransferRequest to a fixed pool
  of sender threads owned by the session and reconnects after reconnect_delay when the tunnel drops. Files
  are resolved with ExpandPath before they are opened.
*/
class AgentClient {
 public:
  explicit AgentClient(AgentOptions options);
  ~AgentClient();

  AgentClient(const AgentClient&)            = delete;
  AgentClient& operator=(const AgentClient&) = delete;

  // Blocks until Stop().
  void Run();

  // One tunnel session. Returns true when the server accepted the
  // registration.
  bool RunOnce();

  void Stop();

  bool IsRegistered() const {
    return registered_.load();
  }

 private:
  AgentOptions options_;

  std::atomic<bool> running_{true};
  std::atomic<bool> registered_{false};

  std::mutex                 mutex_;
  std::condition_variable    cv_;
  ::grpc::ClientContext*     active_context_ = nullptr;
};

} // namespace fetchgate::agent
