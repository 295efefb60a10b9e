#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace fieldsync::util {

/*
  Minimal URL handling for cache keys and endpoint routing.

  Accepts absolute URLs ("https://host:8443/a?b#c") and origin-relative
  paths ("/api/field/job/1").
*/
struct Url {
  std::string scheme; // lower-case, empty for relative urls
  std::string host;   // lower-case
  int         port = 0;
  std::string path = "/";
  std::string query;
};

Url ParseUrl(std::string_view raw);

// Drops fragment, empty query and default ports; lower-cases scheme and host.
std::string NormalizeUrl(std::string_view raw);

std::vector<std::string> SplitPath(std::string_view path);

std::string ToLower(std::string_view value);
bool        StartsWith(std::string_view value, std::string_view prefix);
bool        EndsWith(std::string_view value, std::string_view suffix);

} // namespace fieldsync::util
