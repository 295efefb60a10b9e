#pragma once

#include <sqlite3.h>

#include <memory>
#include <mutex>
#include <string>

namespace fieldsync::db::sqlite {

struct SqliteOptions {
  bool wal_mode         = true;
  bool synchronous_full = false;
};

/*
  Thin RAII wrapper around sqlite3*.

  One connection shared by every component of the process; TxMutex()
  serializes transactions on it.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path, SqliteOptions options = {});
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  std::mutex& TxMutex() {
    return tx_mutex_;
  }

  // Execute a SQL string (used for pragmas/migrations)
  void Exec(const std::string& sql);

  // Prepare a statement (caller must sqlite3_finalize)
  sqlite3_stmt* Prepare(const std::string& sql);

  // Configure PRAGMAs (WAL, synchronous, foreign keys, etc.)
  void Configure();

 private:
  sqlite3*      db_ = nullptr;
  std::string   path_;
  SqliteOptions options_;
  std::mutex    tx_mutex_;
};

} // namespace fieldsync::db::sqlite
