#include "internal/storage/disk/disk_artifact_store.hpp"

#include <arrow/io/file.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <system_error>

#include "internal/observability/logging.hpp"
#include "internal/storage/common/path_utils.hpp"
#include "internal/util/errors.hpp"

namespace fetchgate::storage {

using namespace fetchgate::storage::common;

namespace {

void ThrowIfFailed(const arrow::Status& status, const std::filesystem::path& path) {
  if (!status.ok()) {
    throw util::ArtifactWriteFailure(path.string() + ": " + status.ToString());
  }
}

class DiskArtifactWriter final : public ArtifactWriter {
 public:
  DiskArtifactWriter(std::filesystem::path final_path, std::shared_ptr<arrow::io::FileOutputStream> out)
      : final_path_(std::move(final_path)), staging_path_(StagingPath(final_path_)), out_(std::move(out)) {
  }

  ~DiskArtifactWriter() override {
    if (out_) {
      Abandon();
    }
  }

  void Append(std::string_view bytes) override {
    if (!out_) {
      throw util::ArtifactWriteFailure(final_path_.string() + ": writer is closed");
    }
    if (bytes.empty()) {
      return;
    }
    ThrowIfFailed(out_->Write(bytes.data(), static_cast<int64_t>(bytes.size())), staging_path_);
    bytes_written_ += bytes.size();
  }

  void Finish(bool fsync) override {
    if (!out_) {
      throw util::ArtifactWriteFailure(final_path_.string() + ": writer is closed");
    }

    ThrowIfFailed(out_->Flush(), staging_path_);
    if (fsync && ::fsync(out_->file_descriptor()) != 0) {
      throw util::ArtifactWriteFailure(staging_path_.string() + ": fsync failed: " + std::strerror(errno));
    }
    auto status = out_->Close();
    out_.reset();
    ThrowIfFailed(status, staging_path_);

    std::error_code ec;
    std::filesystem::rename(staging_path_, final_path_, ec);
    if (ec) {
      throw util::ArtifactWriteFailure(final_path_.string() + ": rename failed: " + ec.message());
    }
  }

  void Abandon() noexcept override {
    if (out_) {
      auto status = out_->Close();
      out_.reset();
      if (!status.ok()) {
        FETCHGATE_LOG_WARN("Closing abandoned artifact failed", {observability::StringField("path", staging_path_.string()),
                                                                 observability::StringField("error", status.ToString())});
      }
    }
  }

  std::uint64_t BytesWritten() const override {
    return bytes_written_;
  }

 private:
  std::filesystem::path                        final_path_;
  std::filesystem::path                        staging_path_;
  std::shared_ptr<arrow::io::FileOutputStream> out_;
  std::uint64_t                                bytes_written_ = 0;
};

} // namespace

DiskArtifactStore::DiskArtifactStore(std::filesystem::path root) : root_(std::move(root)) {
  std::filesystem::create_directories(root_);
}

std::filesystem::path DiskArtifactStore::Resolve(const std::string& agent_id, const std::string& transfer_id, const std::string& source_path) const {
  return ArtifactPath(root_, agent_id, transfer_id, source_path);
}

std::unique_ptr<ArtifactWriter> DiskArtifactStore::Open(const std::filesystem::path& artifact_path) {
  const auto parent = artifact_path.parent_path();
  if (!parent.empty()) {
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec) {
      throw util::ArtifactWriteFailure(parent.string() + ": " + ec.message());
    }
  }

  auto staging = StagingPath(artifact_path);
  auto out     = arrow::io::FileOutputStream::Open(staging.string(), /*append=*/false);
  if (!out.ok()) {
    throw util::ArtifactWriteFailure(staging.string() + ": " + out.status().ToString());
  }
  return std::make_unique<DiskArtifactWriter>(artifact_path, *out);
}

} // namespace fetchgate::storage
