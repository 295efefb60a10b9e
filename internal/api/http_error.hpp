#pragma once

#include <exception>

#include "internal/transport/http_types.hpp"

namespace fieldsync::api {

/*
  Converts internal exceptions into HTTP status codes.
*/
int ToHttpStatus(const std::exception& e);

// JSON error body; illegal transitions also list the allowed moves.
transport::Response ToHttpResponse(const std::exception& e);

} // namespace fieldsync::api
