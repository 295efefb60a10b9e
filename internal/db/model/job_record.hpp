#pragma once

#include <cstdint>
#include <string>

#include "internal/model/job_status.hpp"

namespace fieldsync::db::model {

/*
  Authoritative job row. Mutated only by lifecycle::JobLifecycle.

  Timestamps are server unix millis; 0 = not reached yet.
*/
struct JobRecord {
  std::string id;
  std::string org_id;
  std::string technician_id;

  fieldsync::model::JobStatus status = fieldsync::model::JobStatus::kScheduled;

  std::string scheduled_date;
  uint64_t    started_at_ms   = 0;
  uint64_t    completed_at_ms = 0;
  std::string skip_reason;
  std::string notes;

  // incremented on every accepted transition
  uint64_t version = 0;
};

struct PhotoRecord {
  std::string id;
  std::string job_id;
  std::string idempotency_key;

  fieldsync::model::PhotoType type = fieldsync::model::PhotoType::kAfter;

  std::string content_type;
  std::string storage_path;
  uint64_t    size_bytes = 0;

  uint64_t    uploaded_at_ms = 0;
  std::string uploaded_by;

  // position in the job's photo list
  uint64_t ordinal = 0;
};

}
