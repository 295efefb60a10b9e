#include "replay_coordinator.hpp"

#include <set>

#include "internal/codec/upload_codec.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace fieldsync::replay {

using observability::IntField;
using observability::StringField;
using queue::QueuedOperationRecord;

namespace {

constexpr std::size_t kMaxErrorBody = 512;

std::string DescribeResponse(const transport::Response& response) {
  std::string text = "HTTP " + std::to_string(response.status);
  if (!response.body.empty()) {
    text += ": " + response.body.substr(0, kMaxErrorBody);
  }
  return text;
}

} // namespace

Disposition ClassifyStatus(int status) {
  if (status >= 200 && status < 300) return Disposition::kDelivered;
  if (status >= 500 || status == 408 || status == 409 || status == 425 || status == 429) {
    return Disposition::kTransient;
  }
  return Disposition::kPermanent;
}

ReplayCoordinator::ReplayCoordinator(std::shared_ptr<queue::QueueStore> store,
                                     std::shared_ptr<cache::CacheRouter> router,
                                     std::shared_ptr<notify::NotificationBridge> bridge, ReplayOptions options)
    : store_(std::move(store)), router_(std::move(router)), bridge_(std::move(bridge)), options_(options) {
}

DrainReport ReplayCoordinator::DrainNow() {
  DrainReport report;
  {
    std::lock_guard lock(state_mutex_);
    if (draining_) {
      rerun_           = true;
      report.coalesced = true;
      return report;
    }
    draining_ = true;
  }

  try {
    while (true) {
      RunPass(report);

      std::lock_guard lock(state_mutex_);
      if (!rerun_) {
        draining_ = false;
        break;
      }
      rerun_ = false;
    }
  } catch (...) {
    std::lock_guard lock(state_mutex_);
    draining_ = false;
    rerun_    = false;
    throw;
  }

  FIELDSYNC_LOG_INFO("drain finished", {IntField("delivered", report.delivered), IntField("retried", report.retried),
                                        IntField("dead_lettered", report.dead_lettered),
                                        IntField("quarantined", report.quarantined),
                                        IntField("held_back", report.held_back), IntField("store_errors", report.store_errors),
                                        IntField("passes", report.passes)});
  return report;
}

void ReplayCoordinator::RunPass(DrainReport& report) {
  ++report.passes;

  std::set<std::string> blocked_resources;
  uint32_t              store_errors = 0;
  for (const auto& record : store_->ListPending()) {
    if (blocked_resources.contains(record.resource_key)) {
      ++report.held_back;
      continue;
    }

    Outcome outcome;
    try {
      outcome = Attempt(record);
    } catch (const std::exception& e) {
      FIELDSYNC_LOG_ERROR("replay attempt failed", {StringField("id", record.id), StringField("error", e.what())});
      ++store_errors;
      blocked_resources.insert(record.resource_key);
      continue;
    }

    switch (outcome) {
      case Outcome::kDelivered:
        ++report.delivered;
        continue;
      case Outcome::kRetry:
        ++report.retried;
        break;
      case Outcome::kDeadLetter:
        ++report.dead_lettered;
        break;
      case Outcome::kQuarantined:
        ++report.quarantined;
        break;
      case Outcome::kSkipped:
        continue;
    }
    blocked_resources.insert(record.resource_key);
  }

  report.store_errors += store_errors;
  if (store_errors > 0) ReleaseStranded();
}

// A store error after MarkInFlight leaves the record IN_FLIGHT. Only a drain
// moves records there and drains never overlap, so every IN_FLIGHT record
// at this point belongs to the failed attempt.
void ReplayCoordinator::ReleaseStranded() {
  try {
    store_->RecoverInFlight();
  } catch (const std::exception& e) {
    FIELDSYNC_LOG_ERROR("could not release in-flight operations", {StringField("error", e.what())});
  }
}

ReplayCoordinator::Outcome ReplayCoordinator::Attempt(const QueuedOperationRecord& record) {
  codec::WriteRequest write;
  try {
    write = codec::Decode(record.payload);
  } catch (const util::CorruptRecord& e) {
    QueuedOperationRecord quarantined;
    try {
      quarantined = store_->Quarantine(record.id, e.what());
    } catch (const util::NotFound&) {
      return Outcome::kSkipped;
    } catch (const util::InvalidState&) {
      return Outcome::kSkipped;
    }
    FIELDSYNC_LOG_ERROR("quarantined corrupt operation", {StringField("id", record.id), StringField("error", e.what())});
    Notify(notify::EventKind::kDeadLetter, quarantined);
    return Outcome::kQuarantined;
  }

  try {
    store_->MarkInFlight(record.id);
  } catch (const util::NotFound&) {
    // cancelled since the pass listed it
    return Outcome::kSkipped;
  } catch (const util::InvalidState&) {
    return Outcome::kSkipped;
  }

  auto request = codec::ToHttpRequest(write, record.id);
  if (!options_.actor_id.empty()) {
    transport::SetHeader(request.headers, "X-Actor-Id", options_.actor_id);
  }

  transport::Response response;
  try {
    response = router_->FetchNetworkOnly(request, options_.attempt_timeout);
  } catch (const util::Unavailable& e) {
    return RecordTransientFailure(record, e.what());
  } catch (const std::exception& e) {
    FIELDSYNC_LOG_WARN("transport error", {StringField("id", record.id), StringField("error", e.what())});
    return RecordTransientFailure(record, e.what());
  }

  switch (ClassifyStatus(response.status)) {
    case Disposition::kDelivered:
      store_->Delete(record.id);
      FIELDSYNC_LOG_INFO("operation delivered", {StringField("id", record.id), IntField("status", response.status)});
      Notify(notify::EventKind::kUploaded, record);
      return Outcome::kDelivered;

    case Disposition::kTransient:
      return RecordTransientFailure(record, DescribeResponse(response));

    case Disposition::kPermanent:
      break;
  }

  auto rejected = store_->MarkDeadLetter(record.id, model::FailureKind::kPermanent, DescribeResponse(response));
  FIELDSYNC_LOG_WARN("operation rejected by server",
                     {StringField("id", record.id), IntField("status", response.status)});
  Notify(notify::EventKind::kDeadLetter, rejected);
  return Outcome::kDeadLetter;
}

ReplayCoordinator::Outcome ReplayCoordinator::RecordTransientFailure(const QueuedOperationRecord& record,
                                                                     const std::string& error) {
  auto updated = store_->MarkAttemptFailed(record.id, error, options_.max_attempts);
  if (updated.state == model::OperationState::kDeadLetter) {
    FIELDSYNC_LOG_WARN("operation exhausted its attempts",
                       {StringField("id", record.id), IntField("attempts", updated.attempt_count)});
    Notify(notify::EventKind::kDeadLetter, updated);
    return Outcome::kDeadLetter;
  }

  FIELDSYNC_LOG_DEBUG("delivery failed, will retry", {StringField("id", record.id), StringField("error", error)});
  Notify(notify::EventKind::kUploadFailedWillRetry, updated);
  return Outcome::kRetry;
}

void ReplayCoordinator::Notify(notify::EventKind kind, const QueuedOperationRecord& record) {
  notify::Event event;
  event.kind          = kind;
  event.operation_id  = record.id;
  event.endpoint      = record.method + " " + record.target_endpoint;
  event.attempt_count = record.attempt_count;
  event.error         = record.last_error;
  bridge_->Publish(event);
}

} // namespace fieldsync::replay
