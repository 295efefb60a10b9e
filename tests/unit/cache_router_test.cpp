#include <cassert>
#include <chrono>
#include <iostream>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>

#include "config/config.pb.h"
#include "internal/cache/cache_router.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/url.hpp"

namespace {

using fieldsync::cache::CacheRouter;
using fieldsync::cache::CacheStore;
using fieldsync::cache::RoutingRules;
using fieldsync::cache::Strategy;
using fieldsync::transport::Request;
using fieldsync::transport::Response;

/*
  Answers from a url -> response table; counts every send. While
  timeouts is positive each send uses one up and hits its deadline.
*/
class ScriptedTransport final : public fieldsync::transport::Transport {
 public:
  Response Send(const Request& request, std::chrono::milliseconds timeout) override {
    ++sends;
    last_timeout = timeout;
    if (offline) throw fieldsync::util::Unavailable("offline");
    if (timeouts > 0) {
      --timeouts;
      throw fieldsync::util::DeadlineExceeded("deadline exceeded");
    }
    auto it = routes.find(request.url);
    if (it == routes.end()) return fieldsync::transport::MakeResponse(404, "text/plain", "not found");
    return it->second;
  }

  std::map<std::string, Response> routes;
  bool                            offline  = false;
  int                             timeouts = 0;
  int                             sends    = 0;
  std::chrono::milliseconds       last_timeout{0};
};

RoutingRules DefaultRules() {
  fieldsync::runtime::config::RuntimeConfig config;
  fieldsync::config::ConfigLoader::ApplyDefaults(config);
  return RoutingRules::FromConfig(config.cache());
}

struct Fixture {
  std::shared_ptr<fieldsync::db::memory::MemoryRepository> repository =
      std::make_shared<fieldsync::db::memory::MemoryRepository>();
  std::shared_ptr<ScriptedTransport> transport = std::make_shared<ScriptedTransport>();
  std::shared_ptr<CacheStore>        store     = std::make_shared<CacheStore>(repository, "fieldsync", "v1");
  CacheRouter router{transport, store, DefaultRules(), "/app/field", std::chrono::milliseconds(1000)};
};

Request Get(const std::string& url) {
  Request request;
  request.url = url;
  return request;
}

void TestStrategySelection() {
  const auto rules = DefaultRules();

  assert(SelectStrategy(Get("/api/field/job/1"), rules) == Strategy::kNetworkFirst);
  assert(SelectStrategy(Get("/app/field/route"), rules) == Strategy::kNetworkFirst);
  assert(SelectStrategy(Get("/images/logo.svg"), rules) == Strategy::kCacheFirst);
  assert(SelectStrategy(Get("/assets/app.CSS"), rules) == Strategy::kCacheFirst);
  assert(SelectStrategy(Get("/dashboard"), rules) == Strategy::kNetworkOnly);

  auto font        = Get("/cdn/inter");
  font.destination = "font";
  assert(SelectStrategy(font, rules) == Strategy::kCacheFirst);

  // api prefix wins over the extension rule
  assert(SelectStrategy(Get("/api/field/job/1/photo.jpg"), rules) == Strategy::kNetworkFirst);

  auto post   = Get("/api/field/job/1");
  post.method = "POST";
  assert(SelectStrategy(post, rules) == Strategy::kNetworkOnly);

  assert(fieldsync::cache::ToString(Strategy::kCacheFirst) == "cache-first");
}

void TestNetworkFirstServesCacheWhenOffline() {
  Fixture f;
  f.transport->routes["/api/field/job/1"] = fieldsync::transport::MakeResponse(200, "application/json", "{\"v\":1}");

  auto live = f.router.Fetch(Get("/api/field/job/1"));
  assert(live.status == 200);

  f.transport->routes["/api/field/job/1"] = fieldsync::transport::MakeResponse(200, "application/json", "{\"v\":2}");
  assert(f.router.Fetch(Get("/api/field/job/1")).body == "{\"v\":2}");

  f.transport->offline = true;
  auto cached          = f.router.Fetch(Get("/api/field/job/1"));
  assert(cached.status == 200);
  assert(cached.body == "{\"v\":2}");
  assert(fieldsync::transport::FindHeader(cached.headers, "content-type") == "application/json");
}

void TestErrorStatusesAreReturnedButNotCached() {
  Fixture f;
  f.transport->routes["/api/field/job/2"] = fieldsync::transport::MakeResponse(500, "text/plain", "boom");

  auto response = f.router.Fetch(Get("/api/field/job/2"));
  assert(response.status == 500);
  assert(response.body == "boom");

  f.transport->offline = true;
  auto offline         = f.router.Fetch(Get("/api/field/job/2"));
  assert(offline.status == 503);
  assert(offline.body == "Offline - content not available");
  assert(fieldsync::transport::FindHeader(offline.headers, "Content-Type") == "text/plain");
}

void TestNavigationFallsBackToShellPage() {
  Fixture f;
  f.transport->routes["/app/field"] = fieldsync::transport::MakeResponse(200, "text/html", "<shell>");
  assert(f.router.Precache({"/app/field", "/app/field/missing"}) == 1);

  f.transport->offline = true;

  auto page       = Get("/app/field/history");
  page.navigation = true;
  auto response   = f.router.Fetch(page);
  assert(response.status == 200);
  assert(response.body == "<shell>");

  // only navigations get the shell
  auto data = f.router.Fetch(Get("/app/field/history"));
  assert(data.status == 503);
}

void TestCacheFirst() {
  Fixture f;
  f.transport->routes["/images/truck.png"] = fieldsync::transport::MakeResponse(200, "image/png", "PNG");

  assert(f.router.Fetch(Get("/images/truck.png")).body == "PNG");
  const int sends_after_first = f.transport->sends;

  // served from cache without touching the network
  assert(f.router.Fetch(Get("/images/truck.png")).body == "PNG");
  assert(f.transport->sends == sends_after_first);

  f.transport->offline = true;
  auto miss            = f.router.Fetch(Get("/images/other.png"));
  assert(miss.status == 404);
  assert(miss.body.empty());
}

void TestNetworkOnlyPropagatesFailure() {
  Fixture f;
  f.transport->offline = true;

  bool threw = false;
  try {
    (void)f.router.Fetch(Get("/dashboard"));
  } catch (const fieldsync::util::Unavailable&) {
    threw = true;
  }
  assert(threw);
}

void TestTimeoutsFallBackLikeOffline() {
  Fixture f;
  f.transport->routes["/api/field/job/4"]  = fieldsync::transport::MakeResponse(200, "application/json", "{\"v\":4}");
  f.transport->routes["/app/field"]        = fieldsync::transport::MakeResponse(200, "text/html", "<shell>");
  f.transport->routes["/images/truck.png"] = fieldsync::transport::MakeResponse(200, "image/png", "PNG");
  assert(f.router.Precache({"/app/field"}) == 1);
  assert(f.router.Fetch(Get("/api/field/job/4")).status == 200);
  assert(f.router.Fetch(Get("/images/truck.png")).status == 200);

  // network-first: the cached copy
  f.transport->timeouts = 1;
  auto cached           = f.router.Fetch(Get("/api/field/job/4"));
  assert(cached.status == 200);
  assert(cached.body == "{\"v\":4}");
  assert(f.transport->last_timeout == std::chrono::milliseconds(1000));

  // network-first navigation with nothing cached: the shell page
  f.transport->timeouts = 1;
  auto page             = Get("/app/field/history");
  page.navigation       = true;
  auto shell            = f.router.Fetch(page);
  assert(shell.status == 200);
  assert(shell.body == "<shell>");

  // network-first data with nothing cached: synthetic 503
  f.transport->timeouts = 1;
  auto unavailable      = f.router.Fetch(Get("/api/field/job/5"));
  assert(unavailable.status == 503);
  assert(unavailable.body == "Offline - content not available");

  // cache-first: hits never reach the network, misses become 404
  f.transport->timeouts = 1;
  assert(f.router.Fetch(Get("/images/truck.png")).body == "PNG");
  auto miss = f.router.Fetch(Get("/images/other.png"));
  assert(miss.status == 404);
  assert(miss.body.empty());
  assert(f.transport->timeouts == 0);

  // network-only surfaces the timeout itself
  f.transport->timeouts = 1;
  bool threw            = false;
  try {
    (void)f.router.Fetch(Get("/dashboard"));
  } catch (const fieldsync::util::DeadlineExceeded&) {
    threw = true;
  }
  assert(threw);
}

void TestCacheKeysNormalizeUrls() {
  auto a = Get("HTTPS://Field.Example.com:443/api/field/job/1?x=1#top");
  auto b = Get("https://field.example.com/api/field/job/1?x=1");
  assert(CacheStore::KeyFor(a) == CacheStore::KeyFor(b));

  auto lower   = Get("/app/field");
  lower.method = "get";
  assert(CacheStore::KeyFor(lower) == "GET /app/field");
  assert(CacheStore::KeyFor(Get("/app/field?a=1")) != CacheStore::KeyFor(Get("/app/field")));
}

bool RejectsUrl(const std::string& raw) {
  try {
    (void)fieldsync::util::ParseUrl(raw);
  } catch (const std::invalid_argument&) {
    return true;
  }
  return false;
}

void TestUrlPortsAndIpv6Hosts() {
  const auto v6 = fieldsync::util::ParseUrl("http://[::1]/x");
  assert(v6.host == "[::1]");
  assert(v6.port == 0);
  assert(v6.path == "/x");

  const auto v6_port = fieldsync::util::ParseUrl("https://[FE80::1]:8443/api?a=1");
  assert(v6_port.host == "[fe80::1]");
  assert(v6_port.port == 8443);
  assert(fieldsync::util::NormalizeUrl("http://[::1]:80/x") == "http://[::1]/x");

  assert(fieldsync::util::ParseUrl("http://host:65535/").port == 65535);
  assert(RejectsUrl("http://host:65536/"));
  assert(RejectsUrl("http://host:99999999999999999999/"));
  assert(RejectsUrl("http://host:/"));
  assert(RejectsUrl("http://host:8o/"));
}

void TestVersionChangeEvictsOldBuckets() {
  Fixture f;
  f.transport->routes["/app/field"]        = fieldsync::transport::MakeResponse(200, "text/html", "<v1>");
  f.transport->routes["/api/field/job/3"]  = fieldsync::transport::MakeResponse(200, "application/json", "{}");
  f.router.Precache({"/app/field"});
  f.router.Fetch(Get("/api/field/job/3"));
  assert(f.router.Activate() == 0);

  auto        next = std::make_shared<CacheStore>(f.repository, "fieldsync", "v2");
  CacheRouter upgraded{f.transport, next, DefaultRules(), "/app/field", std::chrono::milliseconds(1000)};
  assert(upgraded.Activate() == 2);
  assert(!next->Match(Get("/app/field")).has_value());

  f.transport->offline = true;
  assert(upgraded.Fetch(Get("/api/field/job/3")).status == 503);
}

} // namespace

int main() {
  TestStrategySelection();
  TestNetworkFirstServesCacheWhenOffline();
  TestErrorStatusesAreReturnedButNotCached();
  TestNavigationFallsBackToShellPage();
  TestCacheFirst();
  TestNetworkOnlyPropagatesFailure();
  TestTimeoutsFallBackLikeOffline();
  TestCacheKeysNormalizeUrls();
  TestUrlPortsAndIpv6Hosts();
  TestVersionChangeEvictsOldBuckets();

  std::cout << "fieldsync_unit_cache_router: pass\n";
  return 0;
}
