#pragma once

#include <map>
#include <mutex>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace fieldsync::db::memory {

class MemoryTransaction;

/*
  Process-local backend for tests and ephemeral clients.

  Nothing survives the process; durability needs the sqlite backend.
*/
class MemoryRepository final : public db::Repository {
public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result InsertOperation(Transaction&, const model::QueuedOperationRecord&) override;
  std::optional<model::QueuedOperationRecord> GetOperation(Transaction&, const std::string&) override;
  std::vector<model::QueuedOperationRecord> ListOperations(Transaction&) override;
  Result UpdateOperation(Transaction&, const model::QueuedOperationRecord&) override;
  Result DeleteOperation(Transaction&, const std::string&) override;
  uint64_t MaxOperationSequence(Transaction&) override;

  Result PutCacheEntry(Transaction&, const model::CacheEntryRecord&) override;
  std::optional<model::CacheEntryRecord> GetCacheEntry(Transaction&, const std::string& bucket,
                                                       const std::string& request_key) override;
  std::vector<std::string> ListCacheBuckets(Transaction&) override;
  Result DeleteCacheBucket(Transaction&, const std::string& bucket) override;

  Result InsertJob(Transaction&, const model::JobRecord&) override;
  std::optional<model::JobRecord> GetJob(Transaction&, const std::string&) override;
  Result UpdateJob(Transaction&, const model::JobRecord&) override;

  Result InsertPhoto(Transaction&, const model::PhotoRecord&) override;
  std::optional<model::PhotoRecord> GetPhotoByIdempotencyKey(Transaction&, const std::string&) override;
  std::vector<model::PhotoRecord> ListPhotos(Transaction&, const std::string& job_id) override;

  Result InsertAudit(Transaction&, const model::AuditRecord&) override;
  std::vector<model::AuditRecord> ListAudit(Transaction&, const std::string& job_id) override;

private:
  friend class MemoryTransaction;

  struct State {
    std::unordered_map<std::string, model::QueuedOperationRecord> operations;

    // bucket -> request key -> entry
    std::map<std::string, std::map<std::string, model::CacheEntryRecord>> cache;

    std::unordered_map<std::string, model::JobRecord> jobs;
    std::vector<model::PhotoRecord> photos;
    std::vector<model::AuditRecord> audit;
  };

  // held by the open transaction for its whole lifetime
  std::mutex tx_mutex_;
  State committed_;
};

}
