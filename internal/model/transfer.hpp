#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "internal/model/state_machine.hpp"
#include "internal/util/time.hpp"

namespace fetchgate::model {

enum class FailureReason : std::uint8_t {
  kNone = 0,
  kProtocolViolation = 1,
  kInactivityTimeout = 2,
  kAgentDisconnected = 3,
  kConnectionReplaced = 4,
  kArtifactWriteFailure = 5,
  kAgentAborted = 6,
  kCancelled = 7,
  kDispatchFailed = 8,
};

// Taxonomy name, e.g. "ProtocolViolation".
std::string_view ToString(FailureReason reason);

// Operator facing text used when no more specific message exists,
// e.g. "agent disconnected".
std::string_view DefaultMessage(FailureReason reason);

/*
  Immutable copy of a transfer record as seen by status queries.

  id, agent_id, source_path, artifact_path, session_id and created_at never
  change after creation.
*/
struct TransferSnapshot {
  std::string id;
  std::string agent_id;
  std::string source_path;
  std::string artifact_path;

  // Tunnel session the transfer was dispatched on.
  std::string session_id;

  TransferStatus status = TransferStatus::kPending;

  std::uint64_t                chunks_received = 0;
  std::uint64_t                bytes_received  = 0;
  std::optional<std::uint64_t> declared_total_bytes;

  util::TimePoint                created_at{};
  std::optional<util::TimePoint> completed_at;
  util::TimePoint                last_activity_at{};

  FailureReason              failure = FailureReason::kNone;
  std::optional<std::string> error;
};

} // namespace fetchgate::model
