#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace fieldsync::db::sqlite {

class SqliteRepository final : public db::Repository {
public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

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
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(sqlite3* db, int rc);
};

}
