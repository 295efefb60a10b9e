#pragma once

#include <cstdint>
#include <string>

namespace fieldsync::util {

// Wall clock in unix milliseconds. Server-side stamps (startedAt,
// completedAt, audit, photo upload) all come from here.
uint64_t NowMillis();

// RFC 3339 UTC with millisecond precision; empty for 0.
std::string FormatUnixMillis(uint64_t ms);

} // namespace fieldsync::util
