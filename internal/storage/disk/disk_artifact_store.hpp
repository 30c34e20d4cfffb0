#pragma once

#include <filesystem>
#include <memory>
#include <string>

#include "internal/storage/artifact_store.hpp"

namespace fetchgate::storage {

/*
  Artifact storage on the local disk using Arrow IO.

  Properties:
    - bytes are staged in "<artifact>.part" and renamed into place on Finish
    - optional fsync before the rename
    - an abandoned artifact stays at its staging path, never at the final one
*/

class DiskArtifactStore final : public ArtifactStore {
 public:
  explicit DiskArtifactStore(std::filesystem::path root);

  std::filesystem::path Resolve(const std::string& agent_id, const std::string& transfer_id, const std::string& source_path) const override;

  std::unique_ptr<ArtifactWriter> Open(const std::filesystem::path& artifact_path) override;

  const std::filesystem::path& Root() const {
    return root_;
  }

 private:
  std::filesystem::path root_;
};

} // namespace fetchgate::storage
