#include "json_body.hpp"

#include <google/protobuf/util/json_util.h>

#include <stdexcept>

#include "internal/util/errors.hpp"

namespace fieldsync::api {

std::string ToJson(const google::protobuf::Message& message) {
  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(message, &json);
  if (!status.ok()) {
    throw std::runtime_error("json encode failed: " + std::string(status.message()));
  }
  return json;
}

transport::Response JsonResponse(int status, const google::protobuf::Message& message) {
  return transport::MakeResponse(status, "application/json", ToJson(message));
}

void ParseJsonBody(const std::string& body, google::protobuf::Message* message) {
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  auto status = google::protobuf::util::JsonStringToMessage(body.empty() ? "{}" : body, message, options);
  if (!status.ok()) {
    throw util::InvalidArgument("Invalid request body: " + std::string(status.message()));
  }
}

} // namespace fieldsync::api
