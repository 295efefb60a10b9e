#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <thread>

#include "replay_coordinator.hpp"
#include "wake_scheduler.hpp"

namespace fieldsync::replay {

/*
  Background thread that drains the queue whenever it is woken.

  With a poll interval it also drains on that period, for hosts whose
  connectivity signal never arrives.
*/
class ReplayWorker {
 public:
  ReplayWorker(std::shared_ptr<WakeScheduler> scheduler, std::shared_ptr<ReplayCoordinator> coordinator,
               std::optional<std::chrono::milliseconds> poll_interval = std::nullopt);
  ~ReplayWorker();

  void Start();
  void Stop();

  bool Running() const {
    return running_;
  }

 private:
  void Run();

  std::shared_ptr<WakeScheduler>           scheduler_;
  std::shared_ptr<ReplayCoordinator>       coordinator_;
  std::optional<std::chrono::milliseconds> poll_interval_;

  std::thread       thread_;
  std::atomic<bool> running_{false};
};

} // namespace fieldsync::replay
