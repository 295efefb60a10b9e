#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/model/audit_record.hpp"
#include "internal/db/model/cache_entry_record.hpp"
#include "internal/db/model/job_record.hpp"
#include "internal/db/model/queued_operation_record.hpp"

namespace fieldsync::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All reads and writes go through a Transaction
  - Reads inside a transaction see its writes
  - A crash before Commit() leaves no trace of the transaction

  Client side the DB is the source of truth for:
    queued operations
    cached responses

  Server side:
    jobs, their photos and audit trail
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Queued operations
  // ---------------------------------------------------------------------

  virtual Result InsertOperation(Transaction&, const model::QueuedOperationRecord&) = 0;

  virtual std::optional<model::QueuedOperationRecord> GetOperation(Transaction&, const std::string& id) = 0;

  // Ordered by sequence, oldest first.
  virtual std::vector<model::QueuedOperationRecord> ListOperations(Transaction&) = 0;

  virtual Result UpdateOperation(Transaction&, const model::QueuedOperationRecord&) = 0;

  virtual Result DeleteOperation(Transaction&, const std::string& id) = 0;

  // 0 when the queue has never held a record.
  virtual uint64_t MaxOperationSequence(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Response cache
  // ---------------------------------------------------------------------

  // Insert or replace on (bucket, request_key).
  virtual Result PutCacheEntry(Transaction&, const model::CacheEntryRecord&) = 0;

  virtual std::optional<model::CacheEntryRecord> GetCacheEntry(Transaction&, const std::string& bucket,
                                                               const std::string& request_key) = 0;

  virtual std::vector<std::string> ListCacheBuckets(Transaction&) = 0;

  virtual Result DeleteCacheBucket(Transaction&, const std::string& bucket) = 0;

  // ---------------------------------------------------------------------
  // Jobs
  // ---------------------------------------------------------------------

  virtual Result InsertJob(Transaction&, const model::JobRecord&) = 0;

  virtual std::optional<model::JobRecord> GetJob(Transaction&, const std::string& id) = 0;

  virtual Result UpdateJob(Transaction&, const model::JobRecord&) = 0;

  // ---------------------------------------------------------------------
  // Photos
  // ---------------------------------------------------------------------

  virtual Result InsertPhoto(Transaction&, const model::PhotoRecord&) = 0;

  virtual std::optional<model::PhotoRecord> GetPhotoByIdempotencyKey(Transaction&, const std::string& key) = 0;

  // Ordered by ordinal.
  virtual std::vector<model::PhotoRecord> ListPhotos(Transaction&, const std::string& job_id) = 0;

  // ---------------------------------------------------------------------
  // Audit
  // ---------------------------------------------------------------------

  virtual Result InsertAudit(Transaction&, const model::AuditRecord&) = 0;

  // Oldest first.
  virtual std::vector<model::AuditRecord> ListAudit(Transaction&, const std::string& job_id) = 0;
};

} // namespace fieldsync::db
