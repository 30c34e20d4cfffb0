#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <thread>

namespace fetchgate::core {

class TransferOrchestrator;

/*
  Background worker that expires idle transfers.

  Calls TransferOrchestrator::SweepTimeouts once per interval.
*/
class TimeoutSweeper {
 public:
  TimeoutSweeper(std::shared_ptr<TransferOrchestrator> orchestrator, std::chrono::milliseconds interval);
  ~TimeoutSweeper();

  void Start();
  void Stop();

 private:
  void Run();

  std::shared_ptr<TransferOrchestrator> orchestrator_;
  std::chrono::milliseconds             interval_;

  std::mutex              mutex_;
  std::condition_variable cv_;
  std::thread             thread_;
  std::atomic<bool>       running_{false};
};

} // namespace fetchgate::core
