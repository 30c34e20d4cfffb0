#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

namespace fetchgate::storage {

/*
  Artifact storage abstraction.

  A transfer streams its bytes into exactly one ArtifactWriter. The writer is
  opened on the first accepted chunk and is closed by Finish() or Abandon().

  Implementations:
    DISK  -> Arrow file IO under the download directory
*/

class ArtifactWriter {
 public:
  virtual ~ArtifactWriter() = default;

  // ------------------------------------------------------------------
  // Append
  // ------------------------------------------------------------------
  /*
    Append bytes at the current end of the artifact.

    Throws util::ArtifactWriteFailure.
  */
  virtual void Append(std::string_view bytes) = 0;

  // ------------------------------------------------------------------
  // Finish
  // ------------------------------------------------------------------
  /*
    Flush, optionally fsync, close and publish the artifact at its final
    path. Throws util::ArtifactWriteFailure.
  */
  virtual void Finish(bool fsync) = 0;

  // ------------------------------------------------------------------
  // Abandon
  // ------------------------------------------------------------------
  /*
    Close without publishing. Bytes already written stay where they are.
    Never throws.
  */
  virtual void Abandon() noexcept = 0;

  virtual std::uint64_t BytesWritten() const = 0;
};

class ArtifactStore {
 public:
  virtual ~ArtifactStore() = default;

  // Final location of the artifact for a transfer.
  virtual std::filesystem::path Resolve(const std::string& agent_id, const std::string& transfer_id, const std::string& source_path) const = 0;

  virtual std::unique_ptr<ArtifactWriter> Open(const std::filesystem::path& artifact_path) = 0;
};

using ArtifactStorePtr = std::shared_ptr<ArtifactStore>;

} // namespace fetchgate::storage
