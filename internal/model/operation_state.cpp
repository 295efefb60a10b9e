#include "internal/model/operation_state.hpp"

namespace fieldsync::model {

std::string_view ToString(OperationState state) {
  switch (state) {
    case OperationState::kPending:
      return "PENDING";
    case OperationState::kInFlight:
      return "IN_FLIGHT";
    case OperationState::kDeadLetter:
      return "DEAD_LETTER";
  }
  return "UNKNOWN";
}

std::optional<OperationState> ParseOperationState(std::string_view text) {
  if (text == "PENDING") return OperationState::kPending;
  if (text == "IN_FLIGHT") return OperationState::kInFlight;
  if (text == "DEAD_LETTER") return OperationState::kDeadLetter;
  return std::nullopt;
}

std::string_view ToString(FailureKind kind) {
  switch (kind) {
    case FailureKind::kNone:
      return "none";
    case FailureKind::kTransient:
      return "transient";
    case FailureKind::kPermanent:
      return "permanent";
    case FailureKind::kCorrupt:
      return "corrupt";
  }
  return "unknown";
}

} // namespace fieldsync::model
