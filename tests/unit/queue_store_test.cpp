#include <cassert>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <string>

#include "config/config.pb.h"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/factory.hpp"
#include "internal/queue/queue_store.hpp"
#include "internal/util/errors.hpp"

namespace {

using fieldsync::model::FailureKind;
using fieldsync::model::OperationState;
using fieldsync::queue::QueueStore;

std::filesystem::path TempDbPath(const std::string& name) {
  const auto dir = std::filesystem::temp_directory_path() / "fieldsync_queue_store_tests";
  std::filesystem::create_directories(dir);
  const auto path = dir / (name + ".db");
  for (const char* suffix : {"", "-wal", "-shm"}) {
    std::filesystem::remove(path.string() + suffix);
  }
  return path;
}

std::shared_ptr<fieldsync::db::Repository> OpenSqlite(const std::filesystem::path& path) {
  fieldsync::runtime::config::RuntimeConfig config;
  config.mutable_database()->mutable_sqlite()->set_path(path.string());
  return fieldsync::factory::BuildRepository(config);
}

template <typename Ex, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const Ex&) {
    return true;
  }
  return false;
}

fieldsync::queue::QueuedOperationRecord Enqueue(QueueStore& store, const std::string& job) {
  return store.Create("POST", "/api/field/job/" + job + "/photos", "{\"formatVersion\":1}", "job:" + job);
}

// ---------------------------------------------------------------------------
// Behaviour shared by every backend
// ---------------------------------------------------------------------------

void VerifyFifoOrder(QueueStore& store) {
  const auto a = Enqueue(store, "1");
  const auto b = Enqueue(store, "2");
  const auto c = Enqueue(store, "1");

  assert(a.sequence < b.sequence && b.sequence < c.sequence);

  const auto pending = store.ListPending();
  assert(pending.size() == 3);
  assert(pending[0].id == a.id);
  assert(pending[1].id == b.id);
  assert(pending[2].id == c.id);
  assert(pending[0].state == OperationState::kPending);
  assert(pending[0].attempt_count == 0);
  assert(pending[0].created_at_ms > 0);

  for (const auto& record : pending) store.Cancel(record.id);
  assert(store.ListAll().empty());
}

void VerifyAttemptAccounting(QueueStore& store) {
  const auto record = Enqueue(store, "3");

  store.MarkInFlight(record.id);
  assert(store.Get(record.id)->state == OperationState::kInFlight);
  assert(store.Get(record.id)->last_attempt_at_ms > 0);

  // not PENDING any more
  assert(Throws<fieldsync::util::InvalidState>([&] { store.MarkInFlight(record.id); }));

  auto failed = store.MarkAttemptFailed(record.id, "HTTP 503: busy", 3);
  assert(failed.state == OperationState::kPending);
  assert(failed.attempt_count == 1);
  assert(failed.failure_kind == FailureKind::kTransient);
  assert(failed.last_error == "HTTP 503: busy");

  store.MarkInFlight(record.id);
  store.MarkAttemptFailed(record.id, "timeout", 3);
  store.MarkInFlight(record.id);
  failed = store.MarkAttemptFailed(record.id, "timeout", 3);
  assert(failed.state == OperationState::kDeadLetter);
  assert(failed.attempt_count == 3);
  assert(store.ListPending().empty());

  store.DiscardDeadLetter(record.id);
  assert(!store.Get(record.id).has_value());
}

void VerifyCancelRules(QueueStore& store) {
  const auto record = Enqueue(store, "4");
  store.MarkInFlight(record.id);
  assert(Throws<fieldsync::util::InvalidState>([&] { store.Cancel(record.id); }));

  store.MarkDeadLetter(record.id, FailureKind::kPermanent, "HTTP 400: Skip reason is required");
  assert(Throws<fieldsync::util::InvalidState>([&] { store.Cancel(record.id); }));
  assert(Throws<fieldsync::util::NotFound>([&] { store.Cancel("no-such-id"); }));

  store.DiscardDeadLetter(record.id);
}

void VerifyRetryKeepsPosition(QueueStore& store) {
  const auto first  = Enqueue(store, "5");
  const auto second = Enqueue(store, "5");

  store.MarkInFlight(first.id);
  auto dead = store.MarkDeadLetter(first.id, FailureKind::kPermanent, "HTTP 422: rejected");
  assert(dead.attempt_count == 1);
  assert(dead.failure_kind == FailureKind::kPermanent);

  // dead-lettered twice is a caller bug
  assert(Throws<fieldsync::util::InvalidState>(
      [&] { store.MarkDeadLetter(first.id, FailureKind::kPermanent, "again"); }));
  // only dead-lettered records can be retried or discarded
  assert(Throws<fieldsync::util::InvalidState>([&] { store.RetryDeadLetter(second.id); }));
  assert(Throws<fieldsync::util::InvalidState>([&] { store.DiscardDeadLetter(second.id); }));

  const auto retried = store.RetryDeadLetter(first.id);
  assert(retried.state == OperationState::kPending);
  assert(retried.attempt_count == 0);
  assert(retried.last_error.empty());
  assert(retried.failure_kind == FailureKind::kNone);
  assert(retried.sequence == first.sequence);

  const auto pending = store.ListPending();
  assert(pending.size() == 2);
  assert(pending[0].id == first.id);
  assert(pending[1].id == second.id);

  store.Cancel(first.id);
  store.Cancel(second.id);
}

void VerifyQuarantineCanOnlyBeDiscarded(QueueStore& store) {
  const auto record      = Enqueue(store, "6");
  const auto quarantined = store.Quarantine(record.id, "queued payload is not valid");
  assert(quarantined.state == OperationState::kDeadLetter);
  assert(quarantined.failure_kind == FailureKind::kCorrupt);
  assert(quarantined.attempt_count == 0);

  assert(Throws<fieldsync::util::InvalidState>([&] { store.RetryDeadLetter(record.id); }));
  store.DiscardDeadLetter(record.id);
  assert(store.ListAll().empty());
}

void VerifyDeletedIdsAreGone(QueueStore& store) {
  const auto record = Enqueue(store, "7");
  store.MarkInFlight(record.id);
  store.Delete(record.id);

  assert(!store.Get(record.id).has_value());
  assert(Throws<fieldsync::util::NotFound>([&] { store.Delete(record.id); }));
  assert(Throws<fieldsync::util::NotFound>([&] { store.MarkAttemptFailed(record.id, "late", 3); }));
}

void RunSharedSuite(const std::function<std::shared_ptr<fieldsync::db::Repository>()>& make) {
  auto store = std::make_shared<QueueStore>(make());
  VerifyFifoOrder(*store);
  VerifyAttemptAccounting(*store);
  VerifyCancelRules(*store);
  VerifyRetryKeepsPosition(*store);
  VerifyQuarantineCanOnlyBeDiscarded(*store);
  VerifyDeletedIdsAreGone(*store);
}

// ---------------------------------------------------------------------------
// Durability (sqlite only)
// ---------------------------------------------------------------------------

void TestQueueSurvivesReopen() {
  const auto path = TempDbPath("reopen");

  std::string first_id;
  std::string payload = "{\"formatVersion\":1,\"fields\":[{\"name\":\"type\",\"text\":\"after\"}]}";
  {
    QueueStore store(OpenSqlite(path));
    first_id = store.Create("POST", "/api/field/job/9/photos", payload, "job:9").id;
    store.Create("PUT", "/api/field/job/9", "{}", "job:9");
  }

  QueueStore reopened(OpenSqlite(path));
  const auto pending = reopened.ListPending();
  assert(pending.size() == 2);
  assert(pending[0].id == first_id);
  assert(pending[0].payload == payload);
  assert(pending[0].method == "POST");
  assert(pending[1].method == "PUT");
}

void TestInterruptedSendIsRecovered() {
  const auto path = TempDbPath("crash");

  std::string id;
  {
    QueueStore store(OpenSqlite(path));
    id = Enqueue(store, "10").id;
    store.MarkInFlight(id);
    // process dies mid-send: nothing else is recorded
  }

  QueueStore reopened(OpenSqlite(path));
  assert(reopened.Get(id)->state == OperationState::kInFlight);
  assert(reopened.RecoverInFlight() == 1);

  const auto record = reopened.Get(id);
  assert(record->state == OperationState::kPending);
  assert(record->attempt_count == 0);
  assert(reopened.RecoverInFlight() == 0);
}

} // namespace

int main() {
  RunSharedSuite([] { return std::make_shared<fieldsync::db::memory::MemoryRepository>(); });
  RunSharedSuite([] { return OpenSqlite(TempDbPath("shared")); });

  TestQueueSurvivesReopen();
  TestInterruptedSendIsRecovered();

  std::cout << "fieldsync_unit_queue_store: pass\n";
  return 0;
}
