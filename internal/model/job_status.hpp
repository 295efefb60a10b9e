#pragma once

#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

namespace fieldsync::model {

enum class JobStatus : std::uint8_t {
  kScheduled  = 1,
  kEnRoute    = 2,
  kInProgress = 3,
  kCompleted  = 4,
  kSkipped    = 5,
};

constexpr bool IsTerminal(JobStatus status) {
  return status == JobStatus::kCompleted || status == JobStatus::kSkipped;
}

/*
  Legal transitions:

    SCHEDULED   -> EN_ROUTE | SKIPPED
    EN_ROUTE    -> IN_PROGRESS | SKIPPED
    IN_PROGRESS -> COMPLETED | SKIPPED

  Terminal states accept nothing; self transitions are not transitions.
*/
constexpr bool CanTransition(JobStatus from, JobStatus to) {
  if (IsTerminal(from) || from == to) {
    return false;
  }
  if (to == JobStatus::kSkipped) {
    return true;
  }

  switch (from) {
    case JobStatus::kScheduled:
      return to == JobStatus::kEnRoute;
    case JobStatus::kEnRoute:
      return to == JobStatus::kInProgress;
    case JobStatus::kInProgress:
      return to == JobStatus::kCompleted;
    default:
      return false;
  }
}

constexpr bool RequiresSkipReason(JobStatus to) {
  return to == JobStatus::kSkipped;
}

// startedAt is stamped on entering IN_PROGRESS
constexpr bool StampsStartedAt(JobStatus to) {
  return to == JobStatus::kInProgress;
}

// completedAt is stamped on entering either terminal state
constexpr bool StampsCompletedAt(JobStatus to) {
  return IsTerminal(to);
}

std::string_view ToString(JobStatus status);
std::optional<JobStatus> ParseJobStatus(std::string_view text);

// Maps the field app's action vocabulary: en_route, start, complete, skip.
std::optional<JobStatus> StatusForAction(std::string_view action);

std::vector<JobStatus> AllowedTransitions(JobStatus from);

enum class PhotoType : std::uint8_t {
  kBefore = 1,
  kAfter  = 2,
  kIssue  = 3,
};

std::string_view ToString(PhotoType type);
std::optional<PhotoType> ParsePhotoType(std::string_view text);

} // namespace fieldsync::model
