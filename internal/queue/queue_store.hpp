#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/model/queued_operation_record.hpp"

namespace fieldsync::queue {

using db::model::QueuedOperationRecord;

/*
  Durable queue of deferred writes.

  Every method is one repository transaction: it either fully happens
  or leaves no trace. A record leaves the queue only through Delete
  (server confirmed), Cancel or DiscardDeadLetter.

  Errors:
    util::NotFound      unknown id
    util::InvalidState  operation not allowed in the record's state
*/
class QueueStore {
 public:
  explicit QueueStore(std::shared_ptr<db::Repository> repository);

  QueuedOperationRecord Create(const std::string& method, const std::string& endpoint, std::string encoded_payload,
                               std::string resource_key);

  // PENDING records, oldest enqueue first.
  std::vector<QueuedOperationRecord> ListPending();

  // Every record, oldest enqueue first.
  std::vector<QueuedOperationRecord> ListAll();

  std::optional<QueuedOperationRecord> Get(const std::string& id);

  QueuedOperationRecord MarkInFlight(const std::string& id);

  // IN_FLIGHT -> PENDING, or DEAD_LETTER once max_attempts is reached.
  QueuedOperationRecord MarkAttemptFailed(const std::string& id, const std::string& error, uint32_t max_attempts);

  // Server rejected the write for good; the attempt is counted.
  QueuedOperationRecord MarkDeadLetter(const std::string& id, model::FailureKind kind, const std::string& reason);

  // Payload could not be decoded; no attempt was made.
  QueuedOperationRecord Quarantine(const std::string& id, const std::string& reason);

  void Delete(const std::string& id);

  void Cancel(const std::string& id);

  QueuedOperationRecord RetryDeadLetter(const std::string& id);

  void DiscardDeadLetter(const std::string& id);

  // Start-up only: IN_FLIGHT records left by a crash go back to PENDING.
  std::size_t RecoverInFlight();

 private:
  QueuedOperationRecord Load(db::Transaction& tx, const std::string& id);

  std::shared_ptr<db::Repository> repository_;
};

} // namespace fieldsync::queue
