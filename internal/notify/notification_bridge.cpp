#include "notification_bridge.hpp"

#include <vector>

#include "internal/observability/logging.hpp"

namespace fieldsync::notify {

std::string_view ToString(EventKind kind) {
  switch (kind) {
    case EventKind::kQueued:
      return "queued";
    case EventKind::kUploaded:
      return "uploaded";
    case EventKind::kUploadFailedWillRetry:
      return "upload-failed-will-retry";
    case EventKind::kDeadLetter:
      return "dead-letter";
  }
  return "unknown";
}

SubscriptionId NotificationBridge::Subscribe(Listener listener) {
  std::lock_guard lock(mutex_);
  const auto      id = next_id_++;
  listeners_.emplace(id, std::move(listener));
  return id;
}

void NotificationBridge::Unsubscribe(SubscriptionId id) {
  std::lock_guard lock(mutex_);
  listeners_.erase(id);
}

std::size_t NotificationBridge::SubscriberCount() const {
  std::lock_guard lock(mutex_);
  return listeners_.size();
}

void NotificationBridge::Publish(const Event& event) {
  std::vector<std::pair<SubscriptionId, Listener>> snapshot;
  {
    std::lock_guard lock(mutex_);
    snapshot.assign(listeners_.begin(), listeners_.end());
  }

  for (const auto& [id, listener] : snapshot) {
    try {
      listener(event);
    } catch (const std::exception& e) {
      FIELDSYNC_LOG_WARN("notification listener failed", {observability::IntField("subscription", static_cast<int64_t>(id)),
                                                           observability::StringField("event", ToString(event.kind)),
                                                           observability::StringField("error", e.what())});
    }
  }
}

} // namespace fieldsync::notify
