#pragma once

#include <stdexcept>
#include <string>
#include <utility>

#include "internal/util/errors.hpp"

namespace fieldsync::db {

/*
  Outcome of a repository write.

  Reads answer with a value or std::nullopt. Writes answer with a Result
  carrying a backend-neutral code, so the queue, cache and lifecycle layers
  never see sqlite return codes.
*/

enum class ErrorCode {
  OK = 0,
  NotFound,            // update/delete matched no row
  AlreadyExists,       // duplicate id or idempotency key
  Busy,                // another writer holds the database
  ConstraintViolation, // any other constraint failure
  IOError,
  Corruption,
  InternalError
};

inline const char* ToString(ErrorCode code) {
  switch (code) {
    case ErrorCode::OK:
      return "ok";
    case ErrorCode::NotFound:
      return "not found";
    case ErrorCode::AlreadyExists:
      return "already exists";
    case ErrorCode::Busy:
      return "busy";
    case ErrorCode::ConstraintViolation:
      return "constraint violation";
    case ErrorCode::IOError:
      return "i/o error";
    case ErrorCode::Corruption:
      return "corrupt";
    case ErrorCode::InternalError:
      break;
  }
  return "internal error";
}

struct Result {
  ErrorCode   code = ErrorCode::OK;
  std::string message;

  static Result Ok() { return {}; }

  static Result Err(ErrorCode c, std::string msg = {}) { return {c, std::move(msg)}; }

  explicit operator bool() const { return code == ErrorCode::OK; }
};

// Raises the domain exception for a failed write, prefixed with what the
// caller was doing ("enqueue operation: already exists: ...").
inline void ThrowIfDbError(const Result& result, const std::string& action) {
  if (result) return;

  std::string message = action + ": " + ToString(result.code);
  if (!result.message.empty()) message += ": " + result.message;

  switch (result.code) {
    case ErrorCode::NotFound:
      throw util::NotFound(message);
    case ErrorCode::AlreadyExists:
    case ErrorCode::ConstraintViolation:
      throw util::AlreadyExists(message);
    case ErrorCode::Busy:
      throw util::Conflict(message);
    case ErrorCode::Corruption:
      throw util::CorruptRecord(message);
    default:
      throw std::runtime_error(message);
  }
}

} // namespace fieldsync::db
