#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>

namespace fetchgate::ingest {

using IngestTask = std::function<void()>;

/*
  Bounded blocking queue feeding one ingest worker.

  Enqueue blocks while the queue is full, which pushes back on the tunnel
  reader that produced the event. WaitIdle returns once every accepted task
  has been dequeued and marked done.
*/
class IngestQueue {
 public:
  explicit IngestQueue(std::size_t capacity);

  // false after Shutdown
  bool Enqueue(IngestTask task);

  // blocking wait; nullopt once shut down and empty
  std::optional<IngestTask> Dequeue();

  void MarkDone();
  void WaitIdle();
  void Shutdown();

  std::size_t Depth() const;

 private:
  const std::size_t capacity_;

  mutable std::mutex      mutex_;
  std::condition_variable not_empty_;
  std::condition_variable not_full_;
  std::condition_variable idle_;
  std::deque<IngestTask>  queue_;
  std::size_t             in_flight_ = 0;
  bool                    shutdown_  = false;
};

} // namespace fetchgate::ingest
