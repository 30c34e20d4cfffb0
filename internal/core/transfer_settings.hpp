#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>

namespace fetchgate::core {

// Resolved form of the "transfers" config section.
struct TransferSettings {
  std::filesystem::path     download_dir{"./downloads"};
  std::uint64_t             chunk_size_bytes{1024 * 1024};
  std::chrono::milliseconds inactivity_timeout{30000};
  std::chrono::milliseconds sweep_interval{1000};
  bool                      allow_concurrent_per_agent{true};
  std::size_t               ingest_shards{4};
  std::size_t               ingest_queue_depth{8};
  bool                      fsync_on_complete{false};
};

} // namespace fetchgate::core
