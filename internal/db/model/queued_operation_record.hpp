#pragma once

#include <cstdint>
#include <string>

#include "internal/model/operation_state.hpp"

namespace fieldsync::db::model {

/*
  Persistent queued write.

  IMPORTANT:
  - payload is the encoded text form produced by codec::UploadCodec.
  - sequence is the FIFO key; created_at_ms is informational because
    wall clocks repeat and jump.
*/
struct QueuedOperationRecord {
  std::string id;
  std::string method;
  std::string target_endpoint;
  std::string resource_key;
  std::string payload;

  fieldsync::model::OperationState state        = fieldsync::model::OperationState::kPending;
  fieldsync::model::FailureKind    failure_kind = fieldsync::model::FailureKind::kNone;

  uint64_t sequence      = 0;
  uint64_t created_at_ms = 0;

  uint32_t    attempt_count      = 0;
  uint64_t    last_attempt_at_ms = 0;
  std::string last_error;
};

}
