#include "internal/model/transfer.hpp"

namespace fetchgate::model {

std::string_view ToString(FailureReason reason) {
  switch (reason) {
    case FailureReason::kNone:
      return "None";
    case FailureReason::kProtocolViolation:
      return "ProtocolViolation";
    case FailureReason::kInactivityTimeout:
      return "InactivityTimeout";
    case FailureReason::kAgentDisconnected:
      return "AgentDisconnected";
    case FailureReason::kConnectionReplaced:
      return "ConnectionReplaced";
    case FailureReason::kArtifactWriteFailure:
      return "ArtifactWriteFailure";
    case FailureReason::kAgentAborted:
      return "AgentAborted";
    case FailureReason::kCancelled:
      return "Cancelled";
    case FailureReason::kDispatchFailed:
      return "DispatchFailed";
  }
  return "Unknown";
}

std::string_view DefaultMessage(FailureReason reason) {
  switch (reason) {
    case FailureReason::kNone:
      return "";
    case FailureReason::kProtocolViolation:
      return "protocol violation";
    case FailureReason::kInactivityTimeout:
      return "inactivity timeout";
    case FailureReason::kAgentDisconnected:
      return "agent disconnected";
    case FailureReason::kConnectionReplaced:
      return "connection replaced";
    case FailureReason::kArtifactWriteFailure:
      return "artifact write failure";
    case FailureReason::kAgentAborted:
      return "agent aborted";
    case FailureReason::kCancelled:
      return "cancelled";
    case FailureReason::kDispatchFailed:
      return "dispatch failed";
  }
  return "unknown failure";
}

} // namespace fetchgate::model
