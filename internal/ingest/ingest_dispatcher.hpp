#pragma once

#include <atomic>
#include <cstddef>
#include <memory>
#include <string_view>
#include <thread>
#include <vector>

#include "internal/ingest/ingest_queue.hpp"

namespace fetchgate::ingest {

/*
  Sharded single-writer executor.

  Every task is routed by key to one shard. A shard is a bounded queue
  drained by one thread, so tasks posted under the same key run one at a
  time and in submission order. Transfers use their id as key, which makes
  the owning shard the only writer of that transfer's state.
*/
class IngestDispatcher {
 public:
  IngestDispatcher(std::size_t shard_count, std::size_t queue_depth);
  ~IngestDispatcher();

  void Start();
  void Stop();

  // Blocks while the shard queue is full. false once stopped.
  bool Post(std::string_view key, IngestTask task);

  // Waits until every task posted so far has run.
  void Drain();

  bool Running() const {
    return running_.load();
  }

  std::size_t ShardFor(std::string_view key) const;
  std::size_t ShardCount() const {
    return queues_.size();
  }

 private:
  void Run(std::size_t shard);

  std::vector<std::unique_ptr<IngestQueue>> queues_;
  std::vector<std::thread>                  threads_;
  std::atomic<bool>                         running_{false};
};

} // namespace fetchgate::ingest
