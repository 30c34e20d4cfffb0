#include "internal/ingest/ingest_dispatcher.hpp"

#include <algorithm>
#include <exception>
#include <functional>
#include <string>

#include "internal/observability/logging.hpp"

namespace fetchgate::ingest {

IngestDispatcher::IngestDispatcher(std::size_t shard_count, std::size_t queue_depth) {
  shard_count = std::max<std::size_t>(shard_count, 1);
  queues_.reserve(shard_count);
  for (std::size_t i = 0; i < shard_count; ++i) {
    queues_.push_back(std::make_unique<IngestQueue>(queue_depth));
  }
}

IngestDispatcher::~IngestDispatcher() {
  Stop();
}

void IngestDispatcher::Start() {
  if (running_.exchange(true)) return;

  threads_.reserve(queues_.size());
  for (std::size_t shard = 0; shard < queues_.size(); ++shard) {
    threads_.emplace_back(&IngestDispatcher::Run, this, shard);
  }
}

void IngestDispatcher::Stop() {
  running_ = false;
  for (auto& queue : queues_) {
    queue->Shutdown();
  }
  for (auto& thread : threads_) {
    if (thread.joinable()) thread.join();
  }
  threads_.clear();
}

bool IngestDispatcher::Post(std::string_view key, IngestTask task) {
  return queues_[ShardFor(key)]->Enqueue(std::move(task));
}

void IngestDispatcher::Drain() {
  if (!running_) return;
  for (auto& queue : queues_) {
    queue->WaitIdle();
  }
}

std::size_t IngestDispatcher::ShardFor(std::string_view key) const {
  return std::hash<std::string_view>{}(key) % queues_.size();
}

void IngestDispatcher::Run(std::size_t shard) {
  auto& queue = *queues_[shard];
  while (true) {
    auto task = queue.Dequeue();
    if (!task) break;

    try {
      (*task)();
    } catch (const std::exception& e) {
      FETCHGATE_LOG_ERROR("Ingest task failed", {observability::UintField("shard", shard), observability::StringField("error", e.what())});
    }
    queue.MarkDone();
  }
}

} // namespace fetchgate::ingest
