#include "upload_codec.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include "fieldsync/v1/queue.pb.h"
#include "internal/codec/multipart.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/url.hpp"

namespace fieldsync::codec {

namespace pb = fieldsync::v1;

namespace {

constexpr uint32_t kFormatVersion = 1;

void ValidateRequest(const WriteRequest& request) {
  if (request.method.empty()) throw util::InvalidArgument("write request: method is required");
  if (!util::StartsWith(request.endpoint, "/")) {
    throw util::InvalidArgument("write request: endpoint must be an absolute path: " + request.endpoint);
  }
  for (const auto& field : request.fields) {
    if (field.name.empty()) throw util::InvalidArgument("write request: field without a name");
    if (request.format == BodyFormat::kJson && field.IsBlob()) {
      throw util::InvalidArgument("write request: json body cannot carry blob field " + field.name);
    }
  }
}

pb::BodyFormat ToProto(BodyFormat format) {
  return format == BodyFormat::kJson ? pb::BODY_FORMAT_JSON : pb::BODY_FORMAT_MULTIPART;
}

} // namespace

WriteRequest& WriteRequest::AddText(std::string name, std::string text) {
  fields.push_back(Field{std::move(name), std::move(text)});
  return *this;
}

WriteRequest& WriteRequest::AddBlob(std::string name, Blob blob) {
  fields.push_back(Field{std::move(name), std::move(blob)});
  return *this;
}

const Field* WriteRequest::Find(std::string_view name) const {
  for (const auto& field : fields) {
    if (field.name == name) return &field;
  }
  return nullptr;
}

bool operator==(const Blob& a, const Blob& b) {
  return a.filename == b.filename && a.content_type == b.content_type && a.data == b.data;
}

bool operator==(const Field& a, const Field& b) {
  return a.name == b.name && a.value == b.value;
}

bool operator==(const WriteRequest& a, const WriteRequest& b) {
  return a.method == b.method && a.endpoint == b.endpoint && a.format == b.format && a.fields == b.fields;
}

// ------------------------------------------------------------------
// Persisted form
// ------------------------------------------------------------------

std::string Encode(const WriteRequest& request) {
  ValidateRequest(request);

  pb::QueuedPayload payload;
  payload.set_format_version(kFormatVersion);
  payload.set_method(request.method);
  payload.set_endpoint(request.endpoint);
  payload.set_body_format(ToProto(request.format));

  for (const auto& field : request.fields) {
    auto* out = payload.add_fields();
    out->set_name(field.name);
    if (const auto* blob = std::get_if<Blob>(&field.value)) {
      auto* out_blob = out->mutable_blob();
      out_blob->set_filename(blob->filename);
      out_blob->set_content_type(blob->content_type);
      out_blob->set_data(blob->data);
      out_blob->set_size_bytes(blob->data.size());
    } else {
      out->set_text(std::get<std::string>(field.value));
    }
  }

  std::string text;
  auto        status = google::protobuf::util::MessageToJsonString(payload, &text);
  if (!status.ok()) {
    throw std::runtime_error("encode queued payload: " + std::string(status.message()));
  }
  return text;
}

WriteRequest Decode(std::string_view text) {
  pb::QueuedPayload                         payload;
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(std::string(text), &payload, options);
  if (!status.ok()) {
    throw util::CorruptRecord("queued payload is not valid: " + std::string(status.message()));
  }
  if (payload.format_version() != kFormatVersion) {
    throw util::CorruptRecord("queued payload has unsupported format version " +
                              std::to_string(payload.format_version()));
  }

  WriteRequest request;
  request.method   = payload.method();
  request.endpoint = payload.endpoint();

  switch (payload.body_format()) {
    case pb::BODY_FORMAT_MULTIPART:
      request.format = BodyFormat::kMultipart;
      break;
    case pb::BODY_FORMAT_JSON:
      request.format = BodyFormat::kJson;
      break;
    default:
      throw util::CorruptRecord("queued payload has no body format");
  }

  for (const auto& field : payload.fields()) {
    switch (field.value_case()) {
      case pb::PayloadField::kText:
        request.AddText(field.name(), field.text());
        break;
      case pb::PayloadField::kBlob: {
        const auto& blob = field.blob();
        if (blob.size_bytes() != blob.data().size()) {
          throw util::CorruptRecord("blob field " + field.name() + " is truncated: expected " +
                                    std::to_string(blob.size_bytes()) + " bytes, found " +
                                    std::to_string(blob.data().size()));
        }
        request.AddBlob(field.name(), Blob{blob.filename(), blob.content_type(), blob.data()});
        break;
      }
      default:
        throw util::CorruptRecord("field " + field.name() + " has no value");
    }
  }

  try {
    ValidateRequest(request);
  } catch (const util::InvalidArgument& e) {
    throw util::CorruptRecord(e.what());
  }
  return request;
}

// ------------------------------------------------------------------
// Live request
// ------------------------------------------------------------------

transport::Request ToHttpRequest(const WriteRequest& request, const std::string& idempotency_id) {
  ValidateRequest(request);

  transport::Request out;
  out.method = request.method;
  out.url    = request.endpoint;

  if (request.format == BodyFormat::kJson) {
    google::protobuf::Struct body;
    for (const auto& field : request.fields) {
      (*body.mutable_fields())[field.name].set_string_value(std::get<std::string>(field.value));
    }
    auto status = google::protobuf::util::MessageToJsonString(body, &out.body);
    if (!status.ok()) {
      throw std::runtime_error("encode json body: " + std::string(status.message()));
    }
    out.headers.push_back({"Content-Type", "application/json"});
  } else {
    std::vector<MultipartPart> parts;
    parts.reserve(request.fields.size());
    for (const auto& field : request.fields) {
      if (const auto* blob = std::get_if<Blob>(&field.value)) {
        parts.push_back({field.name, blob->filename.empty() ? field.name : blob->filename,
                         blob->content_type.empty() ? "application/octet-stream" : blob->content_type,
                         blob->data});
      } else {
        parts.push_back({field.name, "", "", std::get<std::string>(field.value)});
      }
    }
    const auto boundary = ChooseBoundary(parts);
    out.body            = BuildMultipartBody(parts, boundary);
    out.headers.push_back({"Content-Type", "multipart/form-data; boundary=" + boundary});
  }

  if (!idempotency_id.empty()) {
    out.headers.push_back({"Idempotency-Key", idempotency_id});
  }
  return out;
}

std::string ResourceKeyFor(std::string_view endpoint) {
  const auto url      = util::ParseUrl(endpoint);
  const auto segments = util::SplitPath(url.path);

  // /api/field/job/<id>[/...]
  if (segments.size() >= 4 && segments[0] == "api" && segments[1] == "field" && segments[2] == "job") {
    return "job:" + segments[3];
  }
  return url.path;
}

} // namespace fieldsync::codec
