#include "queue_store.hpp"

#include "internal/db/api/result.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"

namespace fieldsync::queue {

using model::FailureKind;
using model::OperationState;

namespace {

void RequireState(const QueuedOperationRecord& record, OperationState expected, const char* action) {
  if (record.state != expected) {
    throw util::InvalidState(std::string(action) + " " + record.id + ": operation is " +
                             std::string(model::ToString(record.state)) + ", expected " +
                             std::string(model::ToString(expected)));
  }
}

} // namespace

QueueStore::QueueStore(std::shared_ptr<db::Repository> repository) : repository_(std::move(repository)) {
}

QueuedOperationRecord QueueStore::Load(db::Transaction& tx, const std::string& id) {
  auto record = repository_->GetOperation(tx, id);
  if (!record) {
    throw util::NotFound("queued operation not found: " + id);
  }
  return *record;
}

QueuedOperationRecord QueueStore::Create(const std::string& method, const std::string& endpoint,
                                         std::string encoded_payload, std::string resource_key) {
  QueuedOperationRecord record;
  record.id              = util::NewId();
  record.method          = method;
  record.target_endpoint = endpoint;
  record.resource_key    = std::move(resource_key);
  record.payload         = std::move(encoded_payload);
  record.state           = OperationState::kPending;
  record.created_at_ms   = util::NowMillis();

  auto tx         = repository_->Begin();
  record.sequence = repository_->MaxOperationSequence(*tx) + 1;
  db::ThrowIfDbError(repository_->InsertOperation(*tx, record), "enqueue operation");
  tx->Commit();

  FIELDSYNC_LOG_DEBUG("operation queued", {observability::StringField("id", record.id),
                                           observability::StringField("endpoint", method + " " + endpoint),
                                           observability::IntField("sequence", static_cast<int64_t>(record.sequence))});
  return record;
}

std::vector<QueuedOperationRecord> QueueStore::ListPending() {
  auto tx      = repository_->Begin();
  auto records = repository_->ListOperations(*tx);
  tx->Commit();

  std::vector<QueuedOperationRecord> pending;
  for (auto& record : records) {
    if (record.state == OperationState::kPending) pending.push_back(std::move(record));
  }
  return pending;
}

std::vector<QueuedOperationRecord> QueueStore::ListAll() {
  auto tx      = repository_->Begin();
  auto records = repository_->ListOperations(*tx);
  tx->Commit();
  return records;
}

std::optional<QueuedOperationRecord> QueueStore::Get(const std::string& id) {
  auto tx     = repository_->Begin();
  auto record = repository_->GetOperation(*tx, id);
  tx->Commit();
  return record;
}

QueuedOperationRecord QueueStore::MarkInFlight(const std::string& id) {
  auto tx     = repository_->Begin();
  auto record = Load(*tx, id);
  RequireState(record, OperationState::kPending, "send");

  record.state              = OperationState::kInFlight;
  record.last_attempt_at_ms = util::NowMillis();
  db::ThrowIfDbError(repository_->UpdateOperation(*tx, record), "mark in flight");
  tx->Commit();
  return record;
}

QueuedOperationRecord QueueStore::MarkAttemptFailed(const std::string& id, const std::string& error,
                                                    uint32_t max_attempts) {
  auto tx     = repository_->Begin();
  auto record = Load(*tx, id);
  RequireState(record, OperationState::kInFlight, "record failed attempt for");

  record.attempt_count += 1;
  record.last_error   = error;
  record.failure_kind = FailureKind::kTransient;
  record.state        = record.attempt_count >= max_attempts ? OperationState::kDeadLetter : OperationState::kPending;
  db::ThrowIfDbError(repository_->UpdateOperation(*tx, record), "record failed attempt");
  tx->Commit();
  return record;
}

QueuedOperationRecord QueueStore::MarkDeadLetter(const std::string& id, FailureKind kind, const std::string& reason) {
  auto tx     = repository_->Begin();
  auto record = Load(*tx, id);
  if (record.state == OperationState::kDeadLetter) {
    throw util::InvalidState("operation " + id + " is already dead-lettered");
  }

  record.attempt_count += 1;
  record.last_error   = reason;
  record.failure_kind = kind;
  record.state        = OperationState::kDeadLetter;
  db::ThrowIfDbError(repository_->UpdateOperation(*tx, record), "dead-letter operation");
  tx->Commit();
  return record;
}

QueuedOperationRecord QueueStore::Quarantine(const std::string& id, const std::string& reason) {
  auto tx     = repository_->Begin();
  auto record = Load(*tx, id);

  record.last_error   = reason;
  record.failure_kind = FailureKind::kCorrupt;
  record.state        = OperationState::kDeadLetter;
  db::ThrowIfDbError(repository_->UpdateOperation(*tx, record), "quarantine operation");
  tx->Commit();
  return record;
}

void QueueStore::Delete(const std::string& id) {
  auto tx = repository_->Begin();
  db::ThrowIfDbError(repository_->DeleteOperation(*tx, id), "delete operation");
  tx->Commit();
}

void QueueStore::Cancel(const std::string& id) {
  auto tx     = repository_->Begin();
  auto record = Load(*tx, id);
  if (record.state == OperationState::kInFlight) {
    throw util::InvalidState("operation " + id + " is being sent and cannot be cancelled");
  }
  RequireState(record, OperationState::kPending, "cancel");

  db::ThrowIfDbError(repository_->DeleteOperation(*tx, id), "cancel operation");
  tx->Commit();
}

QueuedOperationRecord QueueStore::RetryDeadLetter(const std::string& id) {
  auto tx     = repository_->Begin();
  auto record = Load(*tx, id);
  RequireState(record, OperationState::kDeadLetter, "retry");
  if (record.failure_kind == FailureKind::kCorrupt) {
    throw util::InvalidState("operation " + id + " is corrupt and can only be discarded");
  }

  // keeps its sequence so per-resource order survives the retry
  record.state         = OperationState::kPending;
  record.failure_kind  = FailureKind::kNone;
  record.attempt_count = 0;
  record.last_error.clear();
  db::ThrowIfDbError(repository_->UpdateOperation(*tx, record), "retry operation");
  tx->Commit();
  return record;
}

void QueueStore::DiscardDeadLetter(const std::string& id) {
  auto tx     = repository_->Begin();
  auto record = Load(*tx, id);
  RequireState(record, OperationState::kDeadLetter, "discard");

  db::ThrowIfDbError(repository_->DeleteOperation(*tx, id), "discard operation");
  tx->Commit();
}

std::size_t QueueStore::RecoverInFlight() {
  auto        tx        = repository_->Begin();
  std::size_t recovered = 0;
  for (auto& record : repository_->ListOperations(*tx)) {
    if (record.state != OperationState::kInFlight) continue;
    record.state = OperationState::kPending;
    db::ThrowIfDbError(repository_->UpdateOperation(*tx, record), "recover in-flight operation");
    ++recovered;
  }
  tx->Commit();

  if (recovered > 0) {
    FIELDSYNC_LOG_WARN("recovered interrupted operations", {observability::IntField("count", static_cast<int64_t>(recovered))});
  }
  return recovered;
}

} // namespace fieldsync::queue
