#include "job_lifecycle.hpp"

#include <algorithm>
#include <cctype>

#include "internal/db/api/result.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/url.hpp"
#include "internal/util/uuid.hpp"

namespace fieldsync::lifecycle {

using db::model::AuditRecord;
using db::model::JobRecord;
using db::model::PhotoRecord;
using model::JobStatus;
using observability::StringField;

namespace {

bool IsBlank(const std::string& value) {
  return std::all_of(value.begin(), value.end(), [](unsigned char c) { return std::isspace(c); });
}

} // namespace

// Marks a job as being validated for the guard's lifetime.
class JobLifecycle::ValidationGuard {
 public:
  ValidationGuard(JobLifecycle& owner, std::string job_id) : owner_(owner), job_id_(std::move(job_id)) {
    std::lock_guard lock(owner_.validating_mutex_);
    if (!owner_.validating_.insert(job_id_).second) {
      throw util::Conflict("job " + job_id_ + " has a transition in progress");
    }
  }

  ~ValidationGuard() {
    std::lock_guard lock(owner_.validating_mutex_);
    owner_.validating_.erase(job_id_);
  }

  ValidationGuard(const ValidationGuard&)            = delete;
  ValidationGuard& operator=(const ValidationGuard&) = delete;

 private:
  JobLifecycle& owner_;
  std::string   job_id_;
};

JobLifecycle::JobLifecycle(std::shared_ptr<db::Repository> repository, storage::PhotoStoragePtr photos,
                           PhotoPolicy policy)
    : repository_(std::move(repository)), photos_(std::move(photos)), policy_(std::move(policy)) {
}

JobRecord JobLifecycle::CreateJob(JobRecord job) {
  if (job.id.empty()) job.id = util::NewId();
  job.status          = JobStatus::kScheduled;
  job.started_at_ms   = 0;
  job.completed_at_ms = 0;
  job.skip_reason.clear();
  job.version = 0;

  auto tx = repository_->Begin();
  db::ThrowIfDbError(repository_->InsertJob(*tx, job), "create job");
  tx->Commit();

  FIELDSYNC_LOG_INFO("job scheduled", {StringField("job_id", job.id), StringField("date", job.scheduled_date)});
  return job;
}

JobSnapshot JobLifecycle::GetJob(const std::string& job_id) {
  auto tx  = repository_->Begin();
  auto job = repository_->GetJob(*tx, job_id);
  if (!job) throw util::NotFound("Job not found: " + job_id);

  JobSnapshot snapshot{*job, repository_->ListPhotos(*tx, job_id)};
  tx->Commit();
  return snapshot;
}

TransitionResult JobLifecycle::Transition(const TransitionRequest& request) {
  ValidationGuard guard(*this, request.job_id);

  auto tx      = repository_->Begin();
  auto current = repository_->GetJob(*tx, request.job_id);
  if (!current) throw util::NotFound("Job not found: " + request.job_id);

  if (!request.operation_id.empty()) {
    const auto audit = repository_->ListAudit(*tx, request.job_id);
    const bool seen  = std::any_of(audit.begin(), audit.end(),
                                   [&](const AuditRecord& entry) { return entry.operation_id == request.operation_id; });
    if (seen) {
      tx->Commit();
      FIELDSYNC_LOG_INFO("duplicate transition ignored",
                         {StringField("job_id", request.job_id), StringField("operation_id", request.operation_id)});
      return {*current, true};
    }
  }

  JobRecord  job  = *current;
  const auto from = job.status;
  if (!model::CanTransition(from, request.target)) {
    throw util::InvalidTransition("Cannot transition from " + std::string(model::ToString(from)) + " to " +
                                      std::string(model::ToString(request.target)),
                                  std::string(model::ToString(from)));
  }
  if (model::RequiresSkipReason(request.target) && IsBlank(request.skip_reason)) {
    throw util::InvalidArgument("Skip reason is required");
  }

  const auto now = util::NowMillis();
  job.status     = request.target;
  if (model::StampsStartedAt(request.target)) job.started_at_ms = now;
  if (model::StampsCompletedAt(request.target)) job.completed_at_ms = now;
  if (request.target == JobStatus::kSkipped) job.skip_reason = request.skip_reason;
  if (request.notes) job.notes = *request.notes;
  job.version += 1;

  AuditRecord audit;
  audit.job_id          = job.id;
  audit.previous_status = from;
  audit.new_status      = job.status;
  audit.actor           = request.actor;
  audit.at_ms           = now;
  audit.skip_reason     = request.target == JobStatus::kSkipped ? request.skip_reason : "";
  audit.operation_id    = request.operation_id;

  db::ThrowIfDbError(repository_->UpdateJob(*tx, job), "update job");
  db::ThrowIfDbError(repository_->InsertAudit(*tx, audit), "append audit");
  tx->Commit();

  FIELDSYNC_LOG_INFO("job transitioned", {StringField("job_id", job.id), StringField("from", model::ToString(from)),
                                          StringField("to", model::ToString(job.status)),
                                          StringField("actor", request.actor)});
  return {job, false};
}

PhotoResult JobLifecycle::AttachPhoto(const PhotoUpload& upload) {
  const auto type = upload.type.empty() ? std::optional<model::PhotoType>(model::PhotoType::kAfter)
                                        : model::ParsePhotoType(upload.type);
  if (!type) {
    throw util::InvalidArgument("Invalid photo type '" + upload.type + "'. Use: before, after, issue");
  }
  if (upload.bytes.empty()) {
    throw util::InvalidArgument("No photo file provided");
  }
  if (upload.bytes.size() > policy_.max_bytes) {
    throw util::InvalidArgument("File too large. Maximum size is " + std::to_string(policy_.max_bytes) + " bytes");
  }
  const auto content_type = util::ToLower(upload.content_type);
  if (std::find(policy_.allowed_content_types.begin(), policy_.allowed_content_types.end(), content_type) ==
      policy_.allowed_content_types.end()) {
    throw util::InvalidArgument("Invalid file type '" + upload.content_type + "'");
  }

  {
    auto tx = repository_->Begin();
    if (!repository_->GetJob(*tx, upload.job_id)) throw util::NotFound("Job not found: " + upload.job_id);

    if (auto existing = repository_->GetPhotoByIdempotencyKey(*tx, upload.idempotency_key)) {
      if (existing->job_id != upload.job_id) {
        throw util::InvalidArgument("Idempotency-Key " + upload.idempotency_key + " was used for another job");
      }
      tx->Commit();
      FIELDSYNC_LOG_INFO("duplicate photo upload ignored", {StringField("job_id", upload.job_id),
                                                            StringField("idempotency_key", upload.idempotency_key)});
      return {*existing, true};
    }
    tx->Commit();
  }

  PhotoRecord photo;
  photo.id              = util::NewId();
  photo.job_id          = upload.job_id;
  photo.idempotency_key = upload.idempotency_key;
  photo.type            = *type;
  photo.content_type    = content_type;
  photo.size_bytes      = upload.bytes.size();
  photo.uploaded_by     = upload.actor;

  // bytes first; a crash here leaves an orphan file, never a dangling record
  photo.storage_path = photos_->Write(photo.job_id, photo.id, content_type, upload.bytes);

  auto tx = repository_->Begin();

  // a concurrent upload with the same key may have won while bytes were written
  if (auto existing = repository_->GetPhotoByIdempotencyKey(*tx, upload.idempotency_key)) {
    tx->Commit();
    photos_->Remove(photo.storage_path);
    return {*existing, true};
  }

  photo.ordinal        = repository_->ListPhotos(*tx, photo.job_id).size();
  photo.uploaded_at_ms = util::NowMillis();
  db::ThrowIfDbError(repository_->InsertPhoto(*tx, photo), "attach photo");
  tx->Commit();

  FIELDSYNC_LOG_INFO("photo attached", {StringField("job_id", photo.job_id), StringField("photo_id", photo.id),
                                        StringField("type", model::ToString(photo.type))});
  return {photo, false};
}

std::vector<PhotoRecord> JobLifecycle::ListPhotos(const std::string& job_id) {
  auto tx = repository_->Begin();
  if (!repository_->GetJob(*tx, job_id)) throw util::NotFound("Job not found: " + job_id);
  auto photos = repository_->ListPhotos(*tx, job_id);
  tx->Commit();
  return photos;
}

std::vector<AuditRecord> JobLifecycle::ListAudit(const std::string& job_id) {
  auto tx = repository_->Begin();
  if (!repository_->GetJob(*tx, job_id)) throw util::NotFound("Job not found: " + job_id);
  auto audit = repository_->ListAudit(*tx, job_id);
  tx->Commit();
  return audit;
}

} // namespace fieldsync::lifecycle
