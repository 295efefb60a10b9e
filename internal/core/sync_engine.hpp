#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/cache/cache_router.hpp"
#include "internal/codec/upload_codec.hpp"
#include "internal/model/job_status.hpp"
#include "internal/notify/notification_bridge.hpp"
#include "internal/queue/queue_store.hpp"
#include "internal/replay/replay_coordinator.hpp"
#include "internal/replay/replay_worker.hpp"
#include "internal/replay/wake_scheduler.hpp"

namespace fieldsync::core {

struct OperationStatus {
  std::string id;
  std::string endpoint; // "METHOD /path"
  std::string resource_key;

  model::OperationState state        = model::OperationState::kPending;
  model::FailureKind    failure_kind = model::FailureKind::kNone;

  uint32_t    attempt_count      = 0;
  uint64_t    created_at_ms      = 0;
  uint64_t    last_attempt_at_ms = 0;
  std::string last_error;
};

struct QueueStatus {
  std::vector<OperationStatus> operations; // enqueue order

  uint32_t pending     = 0;
  uint32_t in_flight   = 0;
  uint32_t dead_letter = 0;
};

struct SyncEngineOptions {
  // drain on this period as well as on wake-ups; unset = wake-ups only
  std::optional<std::chrono::milliseconds> poll_interval;
};

/*
  Client side of the offline sync subsystem.

  Enqueue* persist the write and return its id without touching the
  network. Delivery happens in drains: on Start(), after each enqueue
  and on connectivity signals while the background worker runs, or on
  an explicit DrainNow().
*/
class SyncEngine {
 public:
  SyncEngine(std::shared_ptr<queue::QueueStore> store, std::shared_ptr<cache::CacheRouter> router,
             std::shared_ptr<replay::ReplayCoordinator> coordinator,
             std::shared_ptr<notify::NotificationBridge> bridge, SyncEngineOptions options = {});
  ~SyncEngine();

  SyncEngine(const SyncEngine&)            = delete;
  SyncEngine& operator=(const SyncEngine&) = delete;

  // Recovers interrupted sends, evicts stale cache buckets and starts
  // the background replay worker.
  void Start();
  void Stop();

  // ------------------------------------------------------------------
  // Writes
  // ------------------------------------------------------------------

  std::string EnqueueWrite(const codec::WriteRequest& request);

  std::string EnqueuePhoto(const std::string& job_id, model::PhotoType type, codec::Blob photo);

  // Rejected with util::InvalidState for COMPLETED while a photo for the
  // job is dead-lettered.
  std::string EnqueueTransition(const std::string& job_id, model::JobStatus target, const std::string& skip_reason = "",
                                const std::optional<std::string>& notes = std::nullopt);

  QueueStatus QueryQueueStatus();

  void Cancel(const std::string& id);
  void RetryDeadLetter(const std::string& id);
  void DiscardDeadLetter(const std::string& id);

  // ------------------------------------------------------------------
  // Reads
  // ------------------------------------------------------------------

  transport::Response Fetch(const transport::Request& request);

  std::size_t Precache(const std::vector<std::string>& urls);

  // ------------------------------------------------------------------
  // Delivery
  // ------------------------------------------------------------------

  // Advisory: wakes the worker, or drains inline when none runs.
  void OnConnectivityRestored();
  void OnConnectivityLost();

  replay::DrainReport DrainNow();

  notify::SubscriptionId Subscribe(notify::Listener listener);
  void                   Unsubscribe(notify::SubscriptionId id);

 private:
  void RequestDelivery();

  std::shared_ptr<queue::QueueStore>          store_;
  std::shared_ptr<cache::CacheRouter>         router_;
  std::shared_ptr<replay::ReplayCoordinator>  coordinator_;
  std::shared_ptr<notify::NotificationBridge> bridge_;
  SyncEngineOptions                           options_;

  std::shared_ptr<replay::WakeScheduler> scheduler_;
  std::unique_ptr<replay::ReplayWorker>  worker_;

  std::atomic<bool> online_{true};
};

} // namespace fieldsync::core
