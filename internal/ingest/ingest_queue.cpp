#include "internal/ingest/ingest_queue.hpp"

#include <algorithm>

namespace fetchgate::ingest {

IngestQueue::IngestQueue(std::size_t capacity) : capacity_(std::max<std::size_t>(capacity, 1)) {
}

bool IngestQueue::Enqueue(IngestTask task) {
  {
    std::unique_lock lock(mutex_);
    not_full_.wait(lock, [&] { return shutdown_ || queue_.size() < capacity_; });
    if (shutdown_) return false;
    queue_.push_back(std::move(task));
    ++in_flight_;
  }
  not_empty_.notify_one();
  return true;
}

std::optional<IngestTask> IngestQueue::Dequeue() {
  std::unique_lock lock(mutex_);

  not_empty_.wait(lock, [&] { return shutdown_ || !queue_.empty(); });

  if (queue_.empty()) return std::nullopt;

  IngestTask task = std::move(queue_.front());
  queue_.pop_front();
  lock.unlock();
  not_full_.notify_one();
  return task;
}

void IngestQueue::MarkDone() {
  bool idle = false;
  {
    std::lock_guard lock(mutex_);
    if (in_flight_ > 0) --in_flight_;
    idle = in_flight_ == 0;
  }
  if (idle) idle_.notify_all();
}

void IngestQueue::WaitIdle() {
  std::unique_lock lock(mutex_);
  idle_.wait(lock, [&] { return in_flight_ == 0; });
}

void IngestQueue::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  not_empty_.notify_all();
  not_full_.notify_all();
}

std::size_t IngestQueue::Depth() const {
  std::lock_guard lock(mutex_);
  return queue_.size();
}

} // namespace fetchgate::ingest
