#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>

namespace fieldsync::replay {

/*
  Coalescing wake signal for the replay worker.

  Any number of RequestWake() calls between two waits collapse into a
  single wake-up.
*/
class WakeScheduler {
 public:
  void RequestWake();

  // Blocks until a wake is requested or poll_interval elapses.
  // Returns false once shut down.
  bool WaitForWake(std::optional<std::chrono::milliseconds> poll_interval = std::nullopt);

  void Shutdown();

 private:
  std::mutex              mutex_;
  std::condition_variable cv_;
  bool                    wake_requested_ = false;
  bool                    shutdown_       = false;
};

} // namespace fieldsync::replay
