#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace fieldsync::transport {

struct Header {
  std::string name;
  std::string value;
};

using Headers = std::vector<Header>;

// Header names compare case-insensitively.
std::optional<std::string> FindHeader(const Headers& headers, std::string_view name);
void                       SetHeader(Headers& headers, std::string_view name, std::string value);

// "Name: value\r\n" per header, the stored form of cached responses.
std::string SerializeHeaders(const Headers& headers);
Headers     ParseHeaders(std::string_view block);

/*
  HTTP-shaped request as seen by the routing layer.

  destination mirrors the fetch destination of the caller
  ("document", "image", "font", "script", "style" or empty);
  navigation marks full page loads that may be answered with the
  offline fallback page.
*/
struct Request {
  std::string method = "GET";
  std::string url;
  Headers     headers;
  std::string body;

  std::string destination;
  bool        navigation = false;
};

struct Response {
  int         status = 0;
  Headers     headers;
  std::string body;

  bool Ok() const {
    return status >= 200 && status < 300;
  }
};

Response MakeResponse(int status, std::string_view content_type, std::string body);

} // namespace fieldsync::transport
