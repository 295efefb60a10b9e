#include "cache_store.hpp"

#include <algorithm>
#include <cctype>

#include "internal/db/api/result.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/time.hpp"
#include "internal/util/url.hpp"

namespace fieldsync::cache {

CacheStore::CacheStore(std::shared_ptr<db::Repository> repository, std::string prefix, std::string version)
    : repository_(std::move(repository)),
      static_bucket_(prefix + "-static-" + version),
      dynamic_bucket_(prefix + "-dynamic-" + version) {
}

std::string CacheStore::KeyFor(const transport::Request& request) {
  std::string method = request.method;
  std::transform(method.begin(), method.end(), method.begin(), [](unsigned char c) { return std::toupper(c); });
  return method + " " + util::NormalizeUrl(request.url);
}

void CacheStore::Put(const std::string& bucket, const transport::Request& request,
                     const transport::Response& response) {
  db::model::CacheEntryRecord entry;
  entry.bucket       = bucket;
  entry.request_key  = KeyFor(request);
  entry.status       = response.status;
  entry.headers      = transport::SerializeHeaders(response.headers);
  entry.body         = response.body;
  entry.stored_at_ms = util::NowMillis();

  auto tx = repository_->Begin();
  db::ThrowIfDbError(repository_->PutCacheEntry(*tx, entry), "store cache entry");
  tx->Commit();
}

std::optional<transport::Response> CacheStore::Match(const transport::Request& request) {
  const auto key = KeyFor(request);

  auto tx    = repository_->Begin();
  auto entry = repository_->GetCacheEntry(*tx, dynamic_bucket_, key);
  if (!entry) entry = repository_->GetCacheEntry(*tx, static_bucket_, key);
  tx->Commit();

  if (!entry) return std::nullopt;

  transport::Response response;
  response.status  = entry->status;
  response.headers = transport::ParseHeaders(entry->headers);
  response.body    = std::move(entry->body);
  return response;
}

std::size_t CacheStore::Activate() {
  auto        tx      = repository_->Begin();
  std::size_t evicted = 0;
  for (const auto& bucket : repository_->ListCacheBuckets(*tx)) {
    if (bucket == static_bucket_ || bucket == dynamic_bucket_) continue;
    db::ThrowIfDbError(repository_->DeleteCacheBucket(*tx, bucket), "evict cache bucket");
    FIELDSYNC_LOG_INFO("evicted stale cache bucket", {observability::StringField("bucket", bucket)});
    ++evicted;
  }
  tx->Commit();
  return evicted;
}

} // namespace fieldsync::cache
