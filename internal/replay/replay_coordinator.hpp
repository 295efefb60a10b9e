#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

#include "internal/cache/cache_router.hpp"
#include "internal/notify/notification_bridge.hpp"
#include "internal/queue/queue_store.hpp"

namespace fieldsync::replay {

struct ReplayOptions {
  uint32_t                  max_attempts    = 3;
  std::chrono::milliseconds attempt_timeout = std::chrono::seconds(30);

  // sent as X-Actor-Id on every replayed write
  std::string actor_id;
};

// What a server status means for the queued record that produced it.
enum class Disposition {
  kDelivered, // 2xx
  kTransient, // 408, 409, 425, 429, 5xx
  kPermanent, // any other status
};

Disposition ClassifyStatus(int status);

struct DrainReport {
  uint32_t delivered     = 0;
  uint32_t retried       = 0;
  uint32_t dead_lettered = 0;
  uint32_t quarantined   = 0;
  uint32_t held_back     = 0;
  uint32_t passes        = 0;

  // attempts abandoned because the queue store failed; retried next drain
  uint32_t store_errors = 0;

  // another drain was running; this request became its follow-up pass
  bool coalesced = false;
};

/*
  Replays queued writes against the server.

  One drain at a time: a DrainNow() arriving while a drain runs is
  folded into at most one extra pass of the running drain and returns
  immediately with coalesced set.

  Within a pass records go out in enqueue order. Once a record for a
  resource is left PENDING or dead-lettered, later records for the same
  resource wait for a later drain.
*/
class ReplayCoordinator {
 public:
  ReplayCoordinator(std::shared_ptr<queue::QueueStore> store, std::shared_ptr<cache::CacheRouter> router,
                    std::shared_ptr<notify::NotificationBridge> bridge, ReplayOptions options);

  DrainReport DrainNow();

  const ReplayOptions& Options() const {
    return options_;
  }

 private:
  enum class Outcome {
    kDelivered,
    kRetry,
    kDeadLetter,
    kQuarantined,
    kSkipped,
  };

  void    RunPass(DrainReport& report);
  Outcome Attempt(const queue::QueuedOperationRecord& record);
  void    ReleaseStranded();
  Outcome RecordTransientFailure(const queue::QueuedOperationRecord& record, const std::string& error);

  void Notify(notify::EventKind kind, const queue::QueuedOperationRecord& record);

  std::shared_ptr<queue::QueueStore>          store_;
  std::shared_ptr<cache::CacheRouter>         router_;
  std::shared_ptr<notify::NotificationBridge> bridge_;
  ReplayOptions                               options_;

  std::mutex state_mutex_;
  bool       draining_ = false;
  bool       rerun_    = false;
};

} // namespace fieldsync::replay
