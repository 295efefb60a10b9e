#include "sqlite_tx.hpp"

#include <stdexcept>
#include <string>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace fieldsync::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db) : db_(std::move(db)), lock_(db_->TxMutex()) {
  Control("BEGIN IMMEDIATE;", "begin");
}

SqliteTransaction::~SqliteTransaction() {
  if (!IsOpen()) return;
  const int rc = sqlite3_exec(db_->Handle(), "ROLLBACK;", nullptr, nullptr, nullptr);
  if (rc != SQLITE_OK) {
    FIELDSYNC_LOG_ERROR("sqlite rollback failed", {observability::StringField("path", db_->Path()),
                                                   observability::StringField("error", sqlite3_errmsg(db_->Handle()))});
  }
}

void SqliteTransaction::Control(const char* sql, const char* action) {
  const int rc = sqlite3_exec(db_->Handle(), sql, nullptr, nullptr, nullptr);
  if (rc == SQLITE_OK) return;

  const std::string message = std::string("sqlite ") + action + ": " + sqlite3_errmsg(db_->Handle());
  if (rc == SQLITE_BUSY || rc == SQLITE_LOCKED) throw util::Conflict(message);
  throw std::runtime_error(message);
}

void SqliteTransaction::Commit() {
  RequireOpen("commit");
  try {
    Control("COMMIT;", "commit");
  } catch (const std::exception& e) {
    // a failed COMMIT may leave the transaction open; the destructor rolls it back
    FIELDSYNC_LOG_WARN("sqlite commit failed", {observability::StringField("error", e.what())});
    throw;
  }
  state_ = State::kCommitted;
  lock_.unlock();
}

void SqliteTransaction::Rollback() {
  RequireOpen("rollback");
  Control("ROLLBACK;", "rollback");
  state_ = State::kRolledBack;
  lock_.unlock();
}

} // namespace fieldsync::db::sqlite
