#pragma once

#include <memory>
#include <string>
#include <string_view>

#include "fetchgate/v1/tunnel.pb.h"

namespace fetchgate::tunnel {

/*
  Server side handle on one registered agent tunnel.

  Send() may be called from any thread. Once Close() was called or the
  underlying stream ended, Send() returns false.
*/
class AgentConnection {
 public:
  virtual ~AgentConnection() = default;

  virtual const std::string& AgentId() const   = 0;
  virtual const std::string& SessionId() const = 0;

  virtual bool Send(const fetchgate::v1::ServerMessage& message) = 0;

  // Terminates the session. The reader loop observes the close and returns.
  virtual void Close(std::string_view reason) = 0;

  virtual bool IsClosed() const = 0;
};

using AgentConnectionPtr = std::shared_ptr<AgentConnection>;

} // namespace fetchgate::tunnel
