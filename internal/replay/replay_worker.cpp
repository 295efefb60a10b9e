#include "replay_worker.hpp"

#include "internal/observability/logging.hpp"

namespace fieldsync::replay {

ReplayWorker::ReplayWorker(std::shared_ptr<WakeScheduler> scheduler, std::shared_ptr<ReplayCoordinator> coordinator,
                           std::optional<std::chrono::milliseconds> poll_interval)
    : scheduler_(std::move(scheduler)), coordinator_(std::move(coordinator)), poll_interval_(poll_interval) {
}

ReplayWorker::~ReplayWorker() {
  Stop();
}

void ReplayWorker::Start() {
  if (running_.exchange(true)) return;
  thread_ = std::thread(&ReplayWorker::Run, this);
}

void ReplayWorker::Stop() {
  scheduler_->Shutdown();
  running_ = false;
  if (thread_.joinable()) thread_.join();
}

void ReplayWorker::Run() {
  while (running_) {
    if (!scheduler_->WaitForWake(poll_interval_)) break;

    try {
      coordinator_->DrainNow();
    } catch (const std::exception& e) {
      FIELDSYNC_LOG_ERROR("replay drain failed", {observability::StringField("error", e.what())});
    }
  }
}

} // namespace fieldsync::replay
