#include "grpc_error.hpp"

#include <stdexcept>
#include <string>

namespace fieldsync::grpc {

::grpc::Status ToStatus(const std::exception& e) {
  using namespace fieldsync::util;

  if (dynamic_cast<const NotFound*>(&e)) {
    return {::grpc::StatusCode::NOT_FOUND, e.what()};
  }
  if (dynamic_cast<const AlreadyExists*>(&e)) {
    return {::grpc::StatusCode::ALREADY_EXISTS, e.what()};
  }
  if (dynamic_cast<const InvalidArgument*>(&e)) {
    return {::grpc::StatusCode::INVALID_ARGUMENT, e.what()};
  }
  if (dynamic_cast<const InvalidState*>(&e)) {
    return {::grpc::StatusCode::FAILED_PRECONDITION, e.what()};
  }
  if (dynamic_cast<const Conflict*>(&e)) {
    return {::grpc::StatusCode::ABORTED, e.what()};
  }
  if (dynamic_cast<const DeadlineExceeded*>(&e)) {
    return {::grpc::StatusCode::DEADLINE_EXCEEDED, e.what()};
  }
  if (dynamic_cast<const Unavailable*>(&e)) {
    return {::grpc::StatusCode::UNAVAILABLE, e.what()};
  }

  return {::grpc::StatusCode::INTERNAL, e.what()};
}

void ThrowIfError(const ::grpc::Status& status) {
  if (status.ok()) {
    return;
  }

  switch (status.error_code()) {
    case ::grpc::StatusCode::DEADLINE_EXCEEDED:
      throw util::DeadlineExceeded("gateway deadline exceeded: " + status.error_message());
    case ::grpc::StatusCode::UNAVAILABLE:
      throw util::Unavailable("gateway unavailable: " + status.error_message());
    default:
      throw std::runtime_error("gateway call failed (" + std::to_string(static_cast<int>(status.error_code())) +
                               "): " + status.error_message());
  }
}

} // namespace fieldsync::grpc
