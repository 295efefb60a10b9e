#include "cache_router.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace fieldsync::cache {

using transport::Request;
using transport::Response;

CacheRouter::CacheRouter(std::shared_ptr<transport::Transport> transport, std::shared_ptr<CacheStore> store,
                         RoutingRules rules, std::string offline_fallback_url,
                         std::chrono::milliseconds network_timeout)
    : transport_(std::move(transport)),
      store_(std::move(store)),
      rules_(std::move(rules)),
      offline_fallback_url_(std::move(offline_fallback_url)),
      network_timeout_(network_timeout) {
}

Response CacheRouter::Fetch(const Request& request) {
  switch (SelectStrategy(request, rules_)) {
    case Strategy::kNetworkFirst:
      return NetworkFirst(request);
    case Strategy::kCacheFirst:
      return CacheFirst(request);
    case Strategy::kNetworkOnly:
      break;
  }
  return FetchNetworkOnly(request, network_timeout_);
}

Response CacheRouter::FetchNetworkOnly(const Request& request, std::chrono::milliseconds timeout) {
  return transport_->Send(request, timeout);
}

Response CacheRouter::NetworkFirst(const Request& request) {
  try {
    auto response = transport_->Send(request, network_timeout_);
    if (response.Ok()) {
      store_->Put(store_->DynamicBucket(), request, response);
    }
    return response;
  } catch (const util::Unavailable& e) {
    FIELDSYNC_LOG_DEBUG("network failed, trying cache",
                        {observability::StringField("url", request.url), observability::StringField("error", e.what())});
  }

  if (auto cached = store_->Match(request)) {
    return *cached;
  }

  if (request.navigation) {
    Request fallback;
    fallback.url = offline_fallback_url_;
    if (auto page = store_->Match(fallback)) {
      return *page;
    }
  }

  return transport::MakeResponse(503, "text/plain", "Offline - content not available");
}

Response CacheRouter::CacheFirst(const Request& request) {
  if (auto cached = store_->Match(request)) {
    return *cached;
  }

  try {
    auto response = transport_->Send(request, network_timeout_);
    if (response.Ok()) {
      store_->Put(store_->StaticBucket(), request, response);
    }
    return response;
  } catch (const util::Unavailable& e) {
    FIELDSYNC_LOG_DEBUG("cache miss and network failed",
                        {observability::StringField("url", request.url), observability::StringField("error", e.what())});
  }

  return transport::MakeResponse(404, "", "");
}

std::size_t CacheRouter::Precache(const std::vector<std::string>& urls) {
  std::size_t stored = 0;
  for (const auto& url : urls) {
    Request request;
    request.url = url;
    try {
      auto response = transport_->Send(request, network_timeout_);
      if (!response.Ok()) {
        FIELDSYNC_LOG_WARN("precache skipped", {observability::StringField("url", url),
                                                 observability::IntField("status", response.status)});
        continue;
      }
      store_->Put(store_->StaticBucket(), request, response);
      ++stored;
    } catch (const util::Unavailable& e) {
      FIELDSYNC_LOG_WARN("precache failed",
                         {observability::StringField("url", url), observability::StringField("error", e.what())});
    }
  }
  return stored;
}

} // namespace fieldsync::cache
