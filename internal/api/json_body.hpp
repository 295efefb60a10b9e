#pragma once

#include <google/protobuf/message.h>

#include <string>

#include "internal/transport/http_types.hpp"

namespace fieldsync::api {

std::string ToJson(const google::protobuf::Message& message);

transport::Response JsonResponse(int status, const google::protobuf::Message& message);

// Unknown fields are ignored; malformed JSON throws util::InvalidArgument.
void ParseJsonBody(const std::string& body, google::protobuf::Message* message);

} // namespace fieldsync::api
