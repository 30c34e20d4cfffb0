#include "internal/core/reassembler.hpp"

#include <exception>

#include "internal/util/errors.hpp"

namespace fetchgate::core {

Reassembler::Reassembler(std::shared_ptr<storage::ArtifactStore> store, std::filesystem::path artifact_path, bool fsync_on_complete)
    : store_(std::move(store)), artifact_path_(std::move(artifact_path)), fsync_on_complete_(fsync_on_complete) {
}

Reassembler::~Reassembler() {
  Abandon();
}

Reassembler::AcceptResult Reassembler::Accept(std::uint64_t sequence, std::string_view payload, bool is_last,
                                              std::optional<std::uint64_t> declared_total) {
  if (closed_) {
    return {Outcome::kRejected, model::FailureReason::kProtocolViolation, "chunk after the transfer was closed"};
  }

  if (sequence != expected_sequence_) {
    return Reject(model::FailureReason::kProtocolViolation,
                  "expected chunk " + std::to_string(expected_sequence_) + ", got " + std::to_string(sequence));
  }

  const auto total_after = bytes_written_ + payload.size();
  if (is_last && declared_total && *declared_total != total_after) {
    return Reject(model::FailureReason::kProtocolViolation,
                  "stream ended after " + std::to_string(total_after) + " bytes, agent declared " + std::to_string(*declared_total));
  }

  try {
    if (!writer_) {
      writer_ = store_->Open(artifact_path_);
    }
    writer_->Append(payload);
  } catch (const std::exception& e) {
    return Reject(model::FailureReason::kArtifactWriteFailure, e.what());
  }

  bytes_written_ = total_after;
  ++expected_sequence_;

  if (!is_last) {
    return {Outcome::kApplied, model::FailureReason::kNone, {}};
  }

  try {
    writer_->Finish(fsync_on_complete_);
  } catch (const std::exception& e) {
    return Reject(model::FailureReason::kArtifactWriteFailure, e.what());
  }
  writer_.reset();
  closed_ = true;
  return {Outcome::kCompleted, model::FailureReason::kNone, {}};
}

void Reassembler::Abandon() {
  closed_ = true;
  if (writer_) {
    writer_->Abandon();
    writer_.reset();
  }
}

Reassembler::AcceptResult Reassembler::Reject(model::FailureReason reason, std::string message) {
  Abandon();
  return {Outcome::kRejected, reason, std::move(message)};
}

} // namespace fetchgate::core
