#include "internal/model/job_status.hpp"

namespace fieldsync::model {

namespace {

constexpr JobStatus kAllStatuses[] = {
    JobStatus::kScheduled, JobStatus::kEnRoute, JobStatus::kInProgress, JobStatus::kCompleted, JobStatus::kSkipped,
};

} // namespace

std::string_view ToString(JobStatus status) {
  switch (status) {
    case JobStatus::kScheduled:
      return "SCHEDULED";
    case JobStatus::kEnRoute:
      return "EN_ROUTE";
    case JobStatus::kInProgress:
      return "IN_PROGRESS";
    case JobStatus::kCompleted:
      return "COMPLETED";
    case JobStatus::kSkipped:
      return "SKIPPED";
  }
  return "UNKNOWN";
}

std::optional<JobStatus> ParseJobStatus(std::string_view text) {
  for (auto status : kAllStatuses) {
    if (ToString(status) == text) {
      return status;
    }
  }
  return std::nullopt;
}

std::optional<JobStatus> StatusForAction(std::string_view action) {
  if (action == "en_route") return JobStatus::kEnRoute;
  if (action == "start") return JobStatus::kInProgress;
  if (action == "complete") return JobStatus::kCompleted;
  if (action == "skip") return JobStatus::kSkipped;
  return std::nullopt;
}

std::vector<JobStatus> AllowedTransitions(JobStatus from) {
  std::vector<JobStatus> allowed;
  for (auto to : kAllStatuses) {
    if (CanTransition(from, to)) {
      allowed.push_back(to);
    }
  }
  return allowed;
}

std::string_view ToString(PhotoType type) {
  switch (type) {
    case PhotoType::kBefore:
      return "before";
    case PhotoType::kAfter:
      return "after";
    case PhotoType::kIssue:
      return "issue";
  }
  return "unknown";
}

std::optional<PhotoType> ParsePhotoType(std::string_view text) {
  if (text == "before") return PhotoType::kBefore;
  if (text == "after") return PhotoType::kAfter;
  if (text == "issue") return PhotoType::kIssue;
  return std::nullopt;
}

} // namespace fieldsync::model
