#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string>
#include <string_view>

namespace fieldsync::notify {

enum class EventKind {
  kQueued,
  kUploaded,
  kUploadFailedWillRetry,
  kDeadLetter,
};

// "queued", "uploaded", "upload-failed-will-retry", "dead-letter"
std::string_view ToString(EventKind kind);

struct Event {
  EventKind   kind = EventKind::kQueued;
  std::string operation_id;
  std::string endpoint;
  uint32_t    attempt_count = 0;
  std::string error;
};

using Listener       = std::function<void(const Event&)>;
using SubscriptionId = uint64_t;

/*
  Fan-out of queue progress to whoever is listening.

  Best effort and at-most-once: nothing is buffered for subscribers
  that are not there, and the queue store stays the source of truth.
  Listeners run on the publishing thread, outside the bridge's lock.
*/
class NotificationBridge {
 public:
  SubscriptionId Subscribe(Listener listener);
  void           Unsubscribe(SubscriptionId id);

  void Publish(const Event& event);

  std::size_t SubscriberCount() const;

 private:
  mutable std::mutex                 mutex_;
  std::map<SubscriptionId, Listener> listeners_;
  SubscriptionId                     next_id_ = 1;
};

} // namespace fieldsync::notify
