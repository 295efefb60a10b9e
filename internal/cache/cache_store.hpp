#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>

#include "internal/db/api/repository.hpp"
#include "internal/transport/http_types.hpp"

namespace fieldsync::cache {

/*
  Versioned response cache on top of the repository.

  Two live buckets, "<prefix>-static-<version>" and
  "<prefix>-dynamic-<version>". Changing the version tag and calling
  Activate() drops everything stored under older tags.
*/
class CacheStore {
 public:
  CacheStore(std::shared_ptr<db::Repository> repository, std::string prefix, std::string version);

  const std::string& StaticBucket() const {
    return static_bucket_;
  }

  const std::string& DynamicBucket() const {
    return dynamic_bucket_;
  }

  // METHOD + " " + normalized url
  static std::string KeyFor(const transport::Request& request);

  void Put(const std::string& bucket, const transport::Request& request, const transport::Response& response);

  // Looks in both live buckets.
  std::optional<transport::Response> Match(const transport::Request& request);

  // Deletes every bucket that is not live; returns how many went.
  std::size_t Activate();

 private:
  std::shared_ptr<db::Repository> repository_;
  std::string                     static_bucket_;
  std::string                     dynamic_bucket_;
};

} // namespace fieldsync::cache
