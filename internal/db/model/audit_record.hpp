#pragma once

#include <cstdint>
#include <string>

#include "internal/model/job_status.hpp"

namespace fieldsync::db::model {

/*
  Immutable record of one accepted job transition.
*/
struct AuditRecord {
  std::string job_id;

  fieldsync::model::JobStatus previous_status = fieldsync::model::JobStatus::kScheduled;
  fieldsync::model::JobStatus new_status      = fieldsync::model::JobStatus::kScheduled;

  std::string actor;
  uint64_t    at_ms = 0;
  std::string skip_reason;

  // idempotency id of the request that caused the transition, may be empty
  std::string operation_id;
};

}
