#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace fieldsync::model {

/*
  Queued operation lifecycle:

    PENDING --attempt--> IN_FLIGHT --success--> (deleted)
    IN_FLIGHT --failure--> PENDING (attempt_count + 1)
    attempts exhausted / permanent rejection / corrupt --> DEAD_LETTER

  DEAD_LETTER is terminal for automatic processing.
*/
enum class OperationState : std::uint8_t {
  kPending    = 0,
  kInFlight   = 1,
  kDeadLetter = 2,
};

// Why the last attempt failed, or why the record was dead-lettered.
enum class FailureKind : std::uint8_t {
  kNone      = 0,
  kTransient = 1,
  kPermanent = 2,
  kCorrupt   = 3,
};

std::string_view ToString(OperationState state);
std::optional<OperationState> ParseOperationState(std::string_view text);

std::string_view ToString(FailureKind kind);

} // namespace fieldsync::model
