#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "internal/cache/cache_policy.hpp"
#include "internal/cache/cache_store.hpp"
#include "internal/transport/transport.hpp"

namespace fieldsync::cache {

/*
  Chooses cache or network per request.

  A network failure is an exception from the transport (unreachable or
  timed out); any HTTP status, errors included, is a network success
  and is returned as is. Only 2xx responses are written to the cache.
*/
class CacheRouter {
 public:
  CacheRouter(std::shared_ptr<transport::Transport> transport, std::shared_ptr<CacheStore> store, RoutingRules rules,
              std::string offline_fallback_url, std::chrono::milliseconds network_timeout);

  transport::Response Fetch(const transport::Request& request);

  // Never touches the cache; transport errors propagate.
  transport::Response FetchNetworkOnly(const transport::Request& request, std::chrono::milliseconds timeout);

  // Fetches urls into the static bucket. Returns how many were stored.
  std::size_t Precache(const std::vector<std::string>& urls);

  std::size_t Activate() {
    return store_->Activate();
  }

  const RoutingRules& Rules() const {
    return rules_;
  }

 private:
  transport::Response NetworkFirst(const transport::Request& request);
  transport::Response CacheFirst(const transport::Request& request);

  std::shared_ptr<transport::Transport> transport_;
  std::shared_ptr<CacheStore>           store_;
  RoutingRules                          rules_;
  std::string                           offline_fallback_url_;
  std::chrono::milliseconds             network_timeout_;
};

} // namespace fieldsync::cache
