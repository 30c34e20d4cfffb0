#include "internal/config/settings.hpp"

#include <stdexcept>

namespace fetchgate::config {

namespace {

// Chunks travel as single gRPC messages; keep them well below the default
// 4 MiB receive limit.
constexpr std::uint64_t kMaxChunkSizeBytes = 3ULL * 1024 * 1024;

} // namespace

core::TransferSettings ResolveTransferSettings(const fetchgate::runtime::config::RuntimeConfig& config) {
  core::TransferSettings settings;
  const auto&            transfers = config.transfers();

  if (!transfers.download_dir().empty()) {
    settings.download_dir = transfers.download_dir();
  }
  if (transfers.chunk_size_bytes() > 0) {
    settings.chunk_size_bytes = transfers.chunk_size_bytes();
  }
  if (settings.chunk_size_bytes > kMaxChunkSizeBytes) {
    throw std::runtime_error("Invalid configuration: transfers.chunk_size_bytes must not exceed " + std::to_string(kMaxChunkSizeBytes));
  }
  if (transfers.inactivity_timeout_ms() > 0) {
    settings.inactivity_timeout = std::chrono::milliseconds(transfers.inactivity_timeout_ms());
  }
  if (transfers.sweep_interval_ms() > 0) {
    settings.sweep_interval = std::chrono::milliseconds(transfers.sweep_interval_ms());
  }
  if (settings.sweep_interval > settings.inactivity_timeout) {
    throw std::runtime_error("Invalid configuration: transfers.sweep_interval_ms must not exceed transfers.inactivity_timeout_ms");
  }
  if (transfers.has_allow_concurrent_per_agent()) {
    settings.allow_concurrent_per_agent = transfers.allow_concurrent_per_agent();
  }
  if (transfers.ingest_shards() > 0) {
    settings.ingest_shards = transfers.ingest_shards();
  }
  if (transfers.ingest_queue_depth() > 0) {
    settings.ingest_queue_depth = transfers.ingest_queue_depth();
  }
  settings.fsync_on_complete = transfers.fsync_on_complete();
  return settings;
}

std::string ResolveBindAddress(const fetchgate::runtime::config::RuntimeConfig& config) {
  if (!config.server().bind_address().empty()) {
    return config.server().bind_address();
  }
  return kDefaultBindAddress;
}

} // namespace fetchgate::config
