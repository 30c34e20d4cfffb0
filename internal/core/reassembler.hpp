#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#include "internal/model/transfer.hpp"
#include "internal/storage/artifact_store.hpp"

namespace fetchgate::core {

/*
  Writes the chunks of one transfer, in order, into its artifact.

  Chunk n is accepted only after chunks 1..n-1. Any rejection closes the
  writer without writing the offending payload. The owning shard is the only caller.
*/
class Reassembler {
 public:
  enum class Outcome : std::uint8_t {
    kApplied,
    kCompleted,
    kRejected,
  };

  struct AcceptResult {
    Outcome              outcome = Outcome::kApplied;
    model::FailureReason reason  = model::FailureReason::kNone;
    std::string          message;
  };

  Reassembler(std::shared_ptr<storage::ArtifactStore> store, std::filesystem::path artifact_path, bool fsync_on_complete);
  ~Reassembler();

  Reassembler(const Reassembler&)            = delete;
  Reassembler& operator=(const Reassembler&) = delete;

  AcceptResult Accept(std::uint64_t sequence, std::string_view payload, bool is_last, std::optional<std::uint64_t> declared_total);

  // Releases the writer after a failure decided elsewhere.
  void Abandon();

  std::uint64_t ExpectedSequence() const {
    return expected_sequence_;
  }
  std::uint64_t BytesWritten() const {
    return bytes_written_;
  }
  bool IsClosed() const {
    return closed_;
  }

 private:
  AcceptResult Reject(model::FailureReason reason, std::string message);

  std::shared_ptr<storage::ArtifactStore>  store_;
  std::filesystem::path                    artifact_path_;
  bool                                     fsync_on_complete_;
  std::unique_ptr<storage::ArtifactWriter> writer_;
  std::uint64_t                            expected_sequence_ = 1;
  std::uint64_t                            bytes_written_     = 0;
  bool                                     closed_            = false;
};

} // namespace fetchgate::core
