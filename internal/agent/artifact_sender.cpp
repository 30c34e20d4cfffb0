#include "internal/agent/artifact_sender.hpp"

#include <arrow/buffer.h>
#include <arrow/io/file.h>

#include <algorithm>
#include <filesystem>
#include <optional>
#include <stdexcept>
#include <string_view>

#include "internal/observability/logging.hpp"
#include "internal/storage/common/arrow_utils.hpp"
#include "internal/tunnel/codec.hpp"

namespace fetchgate::agent {

using storage::common::Unwrap;

ArtifactSender::ArtifactSender(std::uint64_t chunk_size_bytes) : chunk_size_bytes_(std::max<std::uint64_t>(chunk_size_bytes, 1)) {
}

SendResult ArtifactSender::Send(const std::string& transfer_id, const std::string& path, ChunkSink& sink) const {
  SendResult result;
  try {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
      throw std::runtime_error("file not found: " + path);
    }
    if (std::filesystem::is_directory(path, ec)) {
      throw std::runtime_error("not a regular file: " + path);
    }

    auto       file = Unwrap(arrow::io::ReadableFile::Open(path));
    const auto size = static_cast<std::uint64_t>(Unwrap(file->GetSize()));

    if (size == 0) {
      if (!sink.Write(tunnel::MakeChunk(transfer_id, 1, {}, true, 0))) {
        result.error = "tunnel closed";
        return result;
      }
      result.ok     = true;
      result.chunks = 1;
      return result;
    }

    std::uint64_t sequence = 0;
    while (result.bytes < size) {
      const auto want   = std::min(chunk_size_bytes_, size - result.bytes);
      auto       buffer = Unwrap(file->Read(static_cast<int64_t>(want)));
      if (buffer->size() == 0) {
        throw std::runtime_error("unexpected end of file after " + std::to_string(result.bytes) + " bytes: " + path);
      }

      const auto got     = static_cast<std::uint64_t>(buffer->size());
      const bool is_last = result.bytes + got >= size;
      std::optional<std::uint64_t> total;
      if (is_last) total = result.bytes + got;

      std::string_view payload(reinterpret_cast<const char*>(buffer->data()), static_cast<std::size_t>(buffer->size()));
      if (!sink.Write(tunnel::MakeChunk(transfer_id, ++sequence, payload, is_last, total))) {
        result.error = "tunnel closed";
        return result;
      }
      result.bytes += got;
      result.chunks = sequence;
    }

    auto close_status = file->Close();
    if (!close_status.ok()) {
      FETCHGATE_LOG_WARN("Closing source file failed", {observability::StringField("path", path), observability::StringField("error", close_status.ToString())});
    }
    result.ok = true;
    return result;
  } catch (const std::exception& e) {
    result.error = e.what();
    if (!sink.Write(tunnel::MakeAbort(transfer_id, result.error))) {
      FETCHGATE_LOG_WARN("Abort could not be delivered", {observability::StringField("transfer_id", transfer_id)});
    }
    return result;
  }
}

} // namespace fetchgate::agent
