#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "internal/transport/http_types.hpp"

namespace fieldsync::runtime::config {
class CacheConfig;
}

namespace fieldsync::cache {

enum class Strategy {
  kNetworkFirst,
  kCacheFirst,
  kNetworkOnly,
};

std::string_view ToString(Strategy strategy);

/*
  Resource classes, evaluated in order:

    non-GET                                  -> network-only
    api prefix                               -> network-first
    image/font/script/style, static prefix
    or static file extension                 -> cache-first
    page prefix                              -> network-first
    anything else                            -> network-only
*/
struct RoutingRules {
  std::vector<std::string> api_prefixes;
  std::vector<std::string> page_prefixes;
  std::vector<std::string> static_prefixes;
  std::vector<std::string> static_extensions;

  static RoutingRules FromConfig(const fieldsync::runtime::config::CacheConfig& config);
};

Strategy SelectStrategy(const transport::Request& request, const RoutingRules& rules);

} // namespace fieldsync::cache
