#include "internal/core/timeout_sweeper.hpp"

#include <exception>

#include "internal/core/transfer_orchestrator.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/time.hpp"

namespace fetchgate::core {

TimeoutSweeper::TimeoutSweeper(std::shared_ptr<TransferOrchestrator> orchestrator, std::chrono::milliseconds interval)
    : orchestrator_(std::move(orchestrator)), interval_(interval) {
}

TimeoutSweeper::~TimeoutSweeper() {
  Stop();
}

void TimeoutSweeper::Start() {
  if (running_.exchange(true)) return;
  thread_ = std::thread(&TimeoutSweeper::Run, this);
}

void TimeoutSweeper::Stop() {
  {
    std::lock_guard lock(mutex_);
    running_ = false;
  }
  cv_.notify_all();
  if (thread_.joinable()) thread_.join();
}

void TimeoutSweeper::Run() {
  std::unique_lock lock(mutex_);
  while (running_) {
    cv_.wait_for(lock, interval_, [&] { return !running_; });
    if (!running_) break;

    lock.unlock();
    try {
      auto expired = orchestrator_->SweepTimeouts(util::SteadyNow());
      if (expired > 0) {
        FETCHGATE_LOG_DEBUG("Posted inactivity checks", {observability::UintField("count", expired)});
      }
    } catch (const std::exception& e) {
      FETCHGATE_LOG_ERROR("Timeout sweep failed", {observability::StringField("error", e.what())});
    }
    lock.lock();
  }
}

} // namespace fetchgate::core
