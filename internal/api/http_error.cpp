#include "http_error.hpp"

#include "fieldsync/v1.hpp"
#include "internal/api/json_body.hpp"
#include "internal/model/job_status.hpp"
#include "internal/util/errors.hpp"

namespace fieldsync::api {

int ToHttpStatus(const std::exception& e) {
  using namespace fieldsync::util;

  if (dynamic_cast<const NotFound*>(&e)) {
    return 404;
  }
  if (dynamic_cast<const InvalidArgument*>(&e) || dynamic_cast<const InvalidState*>(&e)) {
    return 400;
  }
  if (dynamic_cast<const Conflict*>(&e) || dynamic_cast<const AlreadyExists*>(&e)) {
    return 409;
  }
  if (dynamic_cast<const DeadlineExceeded*>(&e)) {
    return 504;
  }
  if (dynamic_cast<const Unavailable*>(&e)) {
    return 503;
  }

  return 500;
}

transport::Response ToHttpResponse(const std::exception& e) {
  fieldsync::v1::ErrorBody body;
  body.set_error(e.what());

  if (const auto* transition = dynamic_cast<const util::InvalidTransition*>(&e)) {
    body.set_current_status(transition->current_status());
    if (auto current = model::ParseJobStatus(transition->current_status())) {
      for (auto status : model::AllowedTransitions(*current)) {
        body.add_allowed_transitions(std::string(model::ToString(status)));
      }
    }
  }

  return JsonResponse(ToHttpStatus(e), body);
}

} // namespace fieldsync::api
