#include "sync_engine.hpp"

#include <algorithm>
#include <cctype>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/url.hpp"

namespace fieldsync::core {

using model::FailureKind;
using model::OperationState;
using observability::StringField;

namespace {

std::string JobPath(const std::string& job_id) {
  if (job_id.empty() || job_id.find('/') != std::string::npos) {
    throw util::InvalidArgument("invalid job id: '" + job_id + "'");
  }
  return "/api/field/job/" + job_id;
}

bool IsBlank(const std::string& value) {
  return std::all_of(value.begin(), value.end(), [](unsigned char c) { return std::isspace(c); });
}

} // namespace

SyncEngine::SyncEngine(std::shared_ptr<queue::QueueStore> store, std::shared_ptr<cache::CacheRouter> router,
                       std::shared_ptr<replay::ReplayCoordinator> coordinator,
                       std::shared_ptr<notify::NotificationBridge> bridge, SyncEngineOptions options)
    : store_(std::move(store)),
      router_(std::move(router)),
      coordinator_(std::move(coordinator)),
      bridge_(std::move(bridge)),
      options_(options) {
}

SyncEngine::~SyncEngine() {
  Stop();
}

void SyncEngine::Start() {
  if (worker_) return;

  store_->RecoverInFlight();
  router_->Activate();

  scheduler_ = std::make_shared<replay::WakeScheduler>();
  worker_    = std::make_unique<replay::ReplayWorker>(scheduler_, coordinator_, options_.poll_interval);
  worker_->Start();

  // anything left from the last session goes out as soon as possible
  scheduler_->RequestWake();
}

void SyncEngine::Stop() {
  if (!worker_) return;
  worker_->Stop();
  worker_.reset();
  scheduler_.reset();
}

void SyncEngine::RequestDelivery() {
  if (worker_ && online_) scheduler_->RequestWake();
}

// ------------------------------------------------------------------
// Writes
// ------------------------------------------------------------------

std::string SyncEngine::EnqueueWrite(const codec::WriteRequest& request) {
  auto encoded = codec::Encode(request);
  auto record  = store_->Create(request.method, request.endpoint, std::move(encoded),
                                codec::ResourceKeyFor(request.endpoint));

  notify::Event event;
  event.kind         = notify::EventKind::kQueued;
  event.operation_id = record.id;
  event.endpoint     = record.method + " " + record.target_endpoint;
  bridge_->Publish(event);

  RequestDelivery();
  return record.id;
}

std::string SyncEngine::EnqueuePhoto(const std::string& job_id, model::PhotoType type, codec::Blob photo) {
  codec::WriteRequest request;
  request.method   = "POST";
  request.endpoint = JobPath(job_id) + "/photos";
  request.format   = codec::BodyFormat::kMultipart;
  request.AddBlob("photo", std::move(photo));
  request.AddText("type", std::string(model::ToString(type)));
  return EnqueueWrite(request);
}

std::string SyncEngine::EnqueueTransition(const std::string& job_id, model::JobStatus target,
                                          const std::string& skip_reason, const std::optional<std::string>& notes) {
  const auto path = JobPath(job_id);

  if (model::RequiresSkipReason(target) && IsBlank(skip_reason)) {
    throw util::InvalidArgument("Skip reason is required");
  }

  if (target == model::JobStatus::kCompleted) {
    const auto resource = codec::ResourceKeyFor(path);
    for (const auto& record : store_->ListAll()) {
      if (record.state == OperationState::kDeadLetter && record.resource_key == resource &&
          util::EndsWith(record.target_endpoint, "/photos")) {
        throw util::InvalidState("job " + job_id + " has a failed photo upload (" + record.id +
                                 "); retry or discard it before completing the job");
      }
    }
  }

  codec::WriteRequest request;
  request.method   = "PUT";
  request.endpoint = path;
  request.format   = codec::BodyFormat::kJson;
  request.AddText("status", std::string(model::ToString(target)));
  if (!skip_reason.empty()) request.AddText("skipReason", skip_reason);
  if (notes) request.AddText("notes", *notes);
  return EnqueueWrite(request);
}

QueueStatus SyncEngine::QueryQueueStatus() {
  QueueStatus status;
  for (const auto& record : store_->ListAll()) {
    OperationStatus op;
    op.id                 = record.id;
    op.endpoint           = record.method + " " + record.target_endpoint;
    op.resource_key       = record.resource_key;
    op.state              = record.state;
    op.failure_kind       = record.failure_kind;
    op.attempt_count      = record.attempt_count;
    op.created_at_ms      = record.created_at_ms;
    op.last_attempt_at_ms = record.last_attempt_at_ms;
    op.last_error         = record.last_error;

    switch (record.state) {
      case OperationState::kPending:
        ++status.pending;
        break;
      case OperationState::kInFlight:
        ++status.in_flight;
        break;
      case OperationState::kDeadLetter:
        ++status.dead_letter;
        break;
    }
    status.operations.push_back(std::move(op));
  }
  return status;
}

void SyncEngine::Cancel(const std::string& id) {
  store_->Cancel(id);
  FIELDSYNC_LOG_INFO("operation cancelled", {StringField("id", id)});
}

void SyncEngine::RetryDeadLetter(const std::string& id) {
  store_->RetryDeadLetter(id);
  FIELDSYNC_LOG_INFO("dead-lettered operation requeued", {StringField("id", id)});
  RequestDelivery();
}

void SyncEngine::DiscardDeadLetter(const std::string& id) {
  store_->DiscardDeadLetter(id);
  FIELDSYNC_LOG_INFO("dead-lettered operation discarded", {StringField("id", id)});
}

// ------------------------------------------------------------------
// Reads
// ------------------------------------------------------------------

transport::Response SyncEngine::Fetch(const transport::Request& request) {
  return router_->Fetch(request);
}

std::size_t SyncEngine::Precache(const std::vector<std::string>& urls) {
  return router_->Precache(urls);
}

// ------------------------------------------------------------------
// Delivery
// ------------------------------------------------------------------

void SyncEngine::OnConnectivityRestored() {
  online_ = true;
  if (worker_) {
    scheduler_->RequestWake();
    return;
  }
  DrainNow();
}

void SyncEngine::OnConnectivityLost() {
  online_ = false;
}

replay::DrainReport SyncEngine::DrainNow() {
  return coordinator_->DrainNow();
}

notify::SubscriptionId SyncEngine::Subscribe(notify::Listener listener) {
  return bridge_->Subscribe(std::move(listener));
}

void SyncEngine::Unsubscribe(notify::SubscriptionId id) {
  bridge_->Unsubscribe(id);
}

} // namespace fieldsync::core
