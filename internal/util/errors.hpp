#pragma once

#include <stdexcept>
#include <string>

namespace fieldsync::util {

/*
  Central error types.

  The server endpoint layer translates these to HTTP status codes,
  the replay coordinator uses the transport ones to classify failures.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class AlreadyExists : public std::runtime_error {
 public:
  explicit AlreadyExists(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Rejected job status change. Carries the status the job is actually in.
class InvalidTransition : public InvalidState {
 public:
  InvalidTransition(const std::string& msg, std::string current_status)
      : InvalidState(msg), current_status_(std::move(current_status)) {
  }

  const std::string& current_status() const {
    return current_status_;
  }

 private:
  std::string current_status_;
};

// Another request is mutating the same entity right now.
class Conflict : public std::runtime_error {
 public:
  explicit Conflict(const std::string& msg) : std::runtime_error(msg) {
  }
};

// A stored record could not be decoded.
class CorruptRecord : public std::runtime_error {
 public:
  explicit CorruptRecord(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Network unreachable or connection dropped before a response arrived.
class Unavailable : public std::runtime_error {
 public:
  explicit Unavailable(const std::string& msg) : std::runtime_error(msg) {
  }
};

class DeadlineExceeded : public Unavailable {
 public:
  explicit DeadlineExceeded(const std::string& msg) : Unavailable(msg) {
  }
};

} // namespace fieldsync::util
