#pragma once

#include <cstdint>
#include <string_view>

namespace fetchgate::model {

enum class TransferStatus : std::uint8_t {
  kUnspecified = 0,
  kPending = 1,
  kDispatched = 2,
  kInProgress = 3,
  kCompleted = 4,
  kFailed = 5,
};

constexpr bool IsTerminal(TransferStatus status) {
  return status == TransferStatus::kCompleted || status == TransferStatus::kFailed;
}

constexpr bool CanTransition(TransferStatus from, TransferStatus to) {
  if (IsTerminal(from)) {
    return false;
  }

  switch (from) {
    case TransferStatus::kPending:
      return to == TransferStatus::kDispatched || to == TransferStatus::kFailed;
    case TransferStatus::kDispatched:
      return to == TransferStatus::kInProgress || to == TransferStatus::kFailed;
    case TransferStatus::kInProgress:
      return to == TransferStatus::kInProgress || to == TransferStatus::kCompleted || to == TransferStatus::kFailed;
    default:
      return false;
  }
}

constexpr std::string_view ToString(TransferStatus status) {
  switch (status) {
    case TransferStatus::kPending:
      return "pending";
    case TransferStatus::kDispatched:
      return "dispatched";
    case TransferStatus::kInProgress:
      return "in_progress";
    case TransferStatus::kCompleted:
      return "completed";
    case TransferStatus::kFailed:
      return "failed";
    default:
      return "unspecified";
  }
}

} // namespace fetchgate::model
