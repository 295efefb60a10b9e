#pragma once

#include <memory>
#include <mutex>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace fieldsync::db::sqlite {

/*
  BEGIN IMMEDIATE ... COMMIT on the shared connection.

  The write lock is taken up front, so a busy database fails at Begin
  (util::Conflict) rather than halfway through a queue update. The
  connection's TxMutex is held until the transaction finishes.
*/
class SqliteTransaction final : public db::Transaction {
 public:
  explicit SqliteTransaction(std::shared_ptr<SqliteDB> db);
  ~SqliteTransaction() override;

  sqlite3* Handle() const { return db_->Handle(); }

  void Commit() override;
  void Rollback() override;

 private:
  // Runs a control statement; SQLITE_BUSY becomes util::Conflict.
  void Control(const char* sql, const char* action);

  std::shared_ptr<SqliteDB>    db_;
  std::unique_lock<std::mutex> lock_;
};

} // namespace fieldsync::db::sqlite
