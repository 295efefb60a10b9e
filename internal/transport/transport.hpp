#pragma once

#include <chrono>

#include "http_types.hpp"

namespace fieldsync::transport {

/*
  Network path to the server.

  Send returns whatever status the server produced, errors included.
  It throws util::Unavailable when no response arrived and
  util::DeadlineExceeded when none arrived within timeout.
*/
class Transport {
 public:
  virtual ~Transport() = default;

  virtual Response Send(const Request& request, std::chrono::milliseconds timeout) = 0;
};

} // namespace fieldsync::transport
