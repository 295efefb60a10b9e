#include "cache_policy.hpp"

#include <algorithm>

#include "config/config.pb.h"
#include "internal/util/url.hpp"

namespace fieldsync::cache {

namespace {

bool AnyPrefix(const std::string& path, const std::vector<std::string>& prefixes) {
  return std::any_of(prefixes.begin(), prefixes.end(),
                     [&](const std::string& prefix) { return util::StartsWith(path, prefix); });
}

bool AnySuffix(const std::string& path, const std::vector<std::string>& suffixes) {
  const auto lowered = util::ToLower(path);
  return std::any_of(suffixes.begin(), suffixes.end(),
                     [&](const std::string& suffix) { return util::EndsWith(lowered, util::ToLower(suffix)); });
}

bool IsStaticDestination(const std::string& destination) {
  return destination == "image" || destination == "font" || destination == "script" || destination == "style";
}

} // namespace

std::string_view ToString(Strategy strategy) {
  switch (strategy) {
    case Strategy::kNetworkFirst:
      return "network-first";
    case Strategy::kCacheFirst:
      return "cache-first";
    case Strategy::kNetworkOnly:
      return "network-only";
  }
  return "unknown";
}

RoutingRules RoutingRules::FromConfig(const fieldsync::runtime::config::CacheConfig& config) {
  RoutingRules rules;
  rules.api_prefixes.assign(config.api_prefixes().begin(), config.api_prefixes().end());
  rules.page_prefixes.assign(config.page_prefixes().begin(), config.page_prefixes().end());
  rules.static_prefixes.assign(config.static_prefixes().begin(), config.static_prefixes().end());
  rules.static_extensions.assign(config.static_extensions().begin(), config.static_extensions().end());
  return rules;
}

Strategy SelectStrategy(const transport::Request& request, const RoutingRules& rules) {
  if (util::ToLower(request.method) != "get") {
    return Strategy::kNetworkOnly;
  }

  const auto path = util::ParseUrl(request.url).path;

  if (AnyPrefix(path, rules.api_prefixes)) {
    return Strategy::kNetworkFirst;
  }
  if (IsStaticDestination(request.destination) || AnyPrefix(path, rules.static_prefixes) ||
      AnySuffix(path, rules.static_extensions)) {
    return Strategy::kCacheFirst;
  }
  if (AnyPrefix(path, rules.page_prefixes)) {
    return Strategy::kNetworkFirst;
  }
  return Strategy::kNetworkOnly;
}

} // namespace fieldsync::cache
