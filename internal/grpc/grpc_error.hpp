#pragma once

#include <grpcpp/grpcpp.h>

#include "internal/util/errors.hpp"

namespace fieldsync::grpc {

/*
  Converts internal exceptions into gRPC status codes.
*/
::grpc::Status ToStatus(const std::exception& e);

/*
  Client side inverse: a failed call becomes util::DeadlineExceeded,
  util::Unavailable or std::runtime_error.
*/
void ThrowIfError(const ::grpc::Status& status);

} // namespace fieldsync::grpc
