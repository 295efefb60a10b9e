#include "wake_scheduler.hpp"

namespace fieldsync::replay {

void WakeScheduler::RequestWake() {
  {
    std::lock_guard lock(mutex_);
    wake_requested_ = true;
  }
  cv_.notify_one();
}

bool WakeScheduler::WaitForWake(std::optional<std::chrono::milliseconds> poll_interval) {
  std::unique_lock lock(mutex_);

  auto ready = [&] { return shutdown_ || wake_requested_; };
  if (poll_interval) {
    cv_.wait_for(lock, *poll_interval, ready);
  } else {
    cv_.wait(lock, ready);
  }

  if (shutdown_) return false;

  wake_requested_ = false;
  return true;
}

void WakeScheduler::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
}

} // namespace fieldsync::replay
