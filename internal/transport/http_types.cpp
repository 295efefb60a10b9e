#include "http_types.hpp"

#include "internal/util/url.hpp"

namespace fieldsync::transport {

namespace {

bool SameName(std::string_view a, std::string_view b) {
  return a.size() == b.size() && util::ToLower(a) == util::ToLower(b);
}

std::string_view Trim(std::string_view value) {
  while (!value.empty() && (value.front() == ' ' || value.front() == '\t')) value.remove_prefix(1);
  while (!value.empty() && (value.back() == ' ' || value.back() == '\t')) value.remove_suffix(1);
  return value;
}

} // namespace

std::optional<std::string> FindHeader(const Headers& headers, std::string_view name) {
  for (const auto& header : headers) {
    if (SameName(header.name, name)) return header.value;
  }
  return std::nullopt;
}

void SetHeader(Headers& headers, std::string_view name, std::string value) {
  for (auto& header : headers) {
    if (SameName(header.name, name)) {
      header.value = std::move(value);
      return;
    }
  }
  headers.push_back({std::string(name), std::move(value)});
}

std::string SerializeHeaders(const Headers& headers) {
  std::string block;
  for (const auto& header : headers) {
    block += header.name;
    block += ": ";
    block += header.value;
    block += "\r\n";
  }
  return block;
}

Headers ParseHeaders(std::string_view block) {
  Headers headers;
  while (!block.empty()) {
    auto             end  = block.find("\r\n");
    std::string_view line = block.substr(0, end);
    block                 = end == std::string_view::npos ? std::string_view() : block.substr(end + 2);

    auto colon = line.find(':');
    if (colon == std::string_view::npos) continue;
    headers.push_back({std::string(Trim(line.substr(0, colon))), std::string(Trim(line.substr(colon + 1)))});
  }
  return headers;
}

Response MakeResponse(int status, std::string_view content_type, std::string body) {
  Response response;
  response.status = status;
  if (!content_type.empty()) {
    response.headers.push_back({"Content-Type", std::string(content_type)});
  }
  response.body = std::move(body);
  return response;
}

} // namespace fieldsync::transport
