#pragma once

#include <stdexcept>
#include <string>

namespace fieldsync::db {

/*
  One unit of work against the queue, cache and job tables.

  - Writes are invisible to other readers until Commit()
  - Rollback() or destruction of an open transaction discards them
  - Only one transaction per database is open at a time; Begin() blocks
  - Commit/Rollback on a finished transaction is a programming error
*/
class Transaction {
public:
  enum class State { kOpen, kCommitted, kRolledBack };

  virtual ~Transaction() = default;

  virtual void Commit()   = 0;
  virtual void Rollback() = 0;

  State state() const { return state_; }
  bool  IsOpen() const { return state_ == State::kOpen; }

protected:
  void RequireOpen(const char* action) const {
    if (state_ != State::kOpen) {
      throw std::logic_error(std::string(action) + " on a finished transaction");
    }
  }

  State state_ = State::kOpen;
};

} // namespace fieldsync::db
