#include "url.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace fieldsync::util {

namespace {

int DefaultPort(const std::string& scheme) {
  if (scheme == "http") return 80;
  if (scheme == "https") return 443;
  return 0;
}

} // namespace

std::string ToLower(std::string_view value) {
  std::string out(value);
  std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return out;
}

bool StartsWith(std::string_view value, std::string_view prefix) {
  return value.size() >= prefix.size() && value.compare(0, prefix.size(), prefix) == 0;
}

bool EndsWith(std::string_view value, std::string_view suffix) {
  return value.size() >= suffix.size() && value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

Url ParseUrl(std::string_view raw) {
  Url url;

  // fragment never reaches the server
  if (const auto hash = raw.find('#'); hash != std::string_view::npos) {
    raw = raw.substr(0, hash);
  }

  if (const auto scheme_end = raw.find("://"); scheme_end != std::string_view::npos) {
    url.scheme = ToLower(raw.substr(0, scheme_end));
    raw        = raw.substr(scheme_end + 3);

    const auto authority_end = raw.find_first_of("/?");
    auto       authority     = raw.substr(0, authority_end);
    raw                      = authority_end == std::string_view::npos ? std::string_view{} : raw.substr(authority_end);

    // an IPv6 literal ("[::1]") carries colons of its own
    const auto colon   = authority.rfind(':');
    const auto bracket = authority.rfind(']');
    if (colon != std::string_view::npos && (bracket == std::string_view::npos || colon > bracket)) {
      const auto port_text = std::string(authority.substr(colon + 1));
      if (port_text.empty() || port_text.size() > 5 ||
          !std::all_of(port_text.begin(), port_text.end(), [](unsigned char c) { return std::isdigit(c); })) {
        throw std::invalid_argument("invalid port in url");
      }
      url.port = std::stoi(port_text);
      if (url.port > 65535) throw std::invalid_argument("invalid port in url");
      authority = authority.substr(0, colon);
    }
    url.host = ToLower(authority);
  }

  if (const auto question = raw.find('?'); question != std::string_view::npos) {
    url.query = std::string(raw.substr(question + 1));
    raw       = raw.substr(0, question);
  }

  url.path = raw.empty() ? "/" : std::string(raw);
  if (url.path.front() != '/') {
    url.path.insert(url.path.begin(), '/');
  }
  return url;
}

std::string NormalizeUrl(std::string_view raw) {
  const auto url = ParseUrl(raw);

  std::string out;
  if (!url.scheme.empty()) {
    out += url.scheme + "://" + url.host;
    if (url.port != 0 && url.port != DefaultPort(url.scheme)) {
      out += ":" + std::to_string(url.port);
    }
  }
  out += url.path;
  if (!url.query.empty()) {
    out += "?" + url.query;
  }
  return out;
}

std::vector<std::string> SplitPath(std::string_view path) {
  std::vector<std::string> segments;
  size_t                   start = 0;
  while (start <= path.size()) {
    const auto end = path.find('/', start);
    const auto len = (end == std::string_view::npos ? path.size() : end) - start;
    if (len > 0) {
      segments.emplace_back(path.substr(start, len));
    }
    if (end == std::string_view::npos) break;
    start = end + 1;
  }
  return segments;
}

} // namespace fieldsync::util
