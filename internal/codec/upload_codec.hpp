#pragma once

#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "internal/transport/http_types.hpp"

namespace fieldsync::codec {

struct Blob {
  std::string filename;
  std::string content_type;
  std::string data;
};

struct Field {
  std::string                     name;
  std::variant<std::string, Blob> value;

  bool IsBlob() const {
    return std::holds_alternative<Blob>(value);
  }
};

enum class BodyFormat {
  kMultipart,
  kJson,
};

/*
  A deferred write as the UI handed it over: destination plus an
  ordered set of form fields. JSON-format requests carry text fields
  only.
*/
struct WriteRequest {
  std::string        method = "POST";
  std::string        endpoint;
  BodyFormat         format = BodyFormat::kMultipart;
  std::vector<Field> fields;

  WriteRequest& AddText(std::string name, std::string text);
  WriteRequest& AddBlob(std::string name, Blob blob);

  const Field* Find(std::string_view name) const;
};

bool operator==(const Blob& a, const Blob& b);
bool operator==(const Field& a, const Field& b);
bool operator==(const WriteRequest& a, const WriteRequest& b);

/*
  Persisted text form of a WriteRequest.

  Encode throws util::InvalidArgument for a request that could never be
  sent. Decode throws util::CorruptRecord for anything Encode could not
  have produced; Decode(Encode(r)) == r.
*/
std::string  Encode(const WriteRequest& request);
WriteRequest Decode(std::string_view text);

// Live request for (re)submission, Idempotency-Key set to idempotency_id.
transport::Request ToHttpRequest(const WriteRequest& request, const std::string& idempotency_id);

// "job:<id>" for job endpoints, else the path.
std::string ResourceKeyFor(std::string_view endpoint);

} // namespace fieldsync::codec
