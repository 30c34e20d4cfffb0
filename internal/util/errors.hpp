#pragma once

#include <stdexcept>
#include <string>

namespace fetchgate::util {

/*
  Central error types.

  Control-plane failures are thrown and translated to gRPC status codes in
  internal/grpc/grpc_error.cpp. Data-path failures are recorded on the
  transfer instead and never reach the transport.
*/

class AgentNotConnected : public std::runtime_error {
 public:
  explicit AgentNotConnected(const std::string& msg) : std::runtime_error(msg) {
  }
};

class AgentBusy : public std::runtime_error {
 public:
  explicit AgentBusy(const std::string& msg) : std::runtime_error(msg) {
  }
};

class TransferNotFound : public std::runtime_error {
 public:
  explicit TransferNotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ProtocolViolation : public std::runtime_error {
 public:
  explicit ProtocolViolation(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ArtifactWriteFailure : public std::runtime_error {
 public:
  explicit ArtifactWriteFailure(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace fetchgate::util
