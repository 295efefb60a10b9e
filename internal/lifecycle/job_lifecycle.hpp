#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/model/job_status.hpp"
#include "internal/storage/photo_storage.hpp"

namespace fieldsync::lifecycle {

struct PhotoPolicy {
  uint64_t                 max_bytes = 10ull * 1024 * 1024;
  std::vector<std::string> allowed_content_types{"image/jpeg", "image/png", "image/webp"};
};

struct TransitionRequest {
  std::string                job_id;
  model::JobStatus           target = model::JobStatus::kScheduled;
  std::string                actor;
  std::string                skip_reason;
  std::optional<std::string> notes;

  // client idempotency id; a repeat is answered without effect
  std::string operation_id;
};

struct TransitionResult {
  db::model::JobRecord job;
  bool                 duplicate = false;
};

struct PhotoUpload {
  std::string job_id;
  std::string type; // before | after | issue, empty = after
  std::string content_type;
  std::string bytes;
  std::string actor;
  std::string idempotency_key;
};

struct PhotoResult {
  db::model::PhotoRecord photo;
  bool                   duplicate = false;
};

struct JobSnapshot {
  db::model::JobRecord                job;
  std::vector<db::model::PhotoRecord> photos;
};

/*
  Server-authoritative job state machine.

  The only writer of job rows. Every accepted transition bumps the
  job version and appends one audit record in the same transaction;
  timestamps come from the server clock only.

  Errors:
    util::NotFound           unknown job
    util::InvalidTransition  move not in the legal table
    util::InvalidArgument    missing skip reason, bad photo type/content
    util::Conflict           another transition of the job is in progress
*/
class JobLifecycle {
 public:
  JobLifecycle(std::shared_ptr<db::Repository> repository, storage::PhotoStoragePtr photos, PhotoPolicy policy);

  // Seeds a job in SCHEDULED; generates an id when none is given.
  db::model::JobRecord CreateJob(db::model::JobRecord job);

  JobSnapshot GetJob(const std::string& job_id);

  TransitionResult Transition(const TransitionRequest& request);

  PhotoResult AttachPhoto(const PhotoUpload& upload);

  std::vector<db::model::PhotoRecord> ListPhotos(const std::string& job_id);

  std::vector<db::model::AuditRecord> ListAudit(const std::string& job_id);

 private:
  class ValidationGuard;

  std::shared_ptr<db::Repository> repository_;
  storage::PhotoStoragePtr        photos_;
  PhotoPolicy                     policy_;

  std::mutex            validating_mutex_;
  std::set<std::string> validating_;
};

} // namespace fieldsync::lifecycle
