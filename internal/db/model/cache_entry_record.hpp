#pragma once

#include <cstdint>
#include <string>

namespace fieldsync::db::model {

/*
  Stored response, keyed by (bucket, request key).

  headers is an HTTP header block ("Name: value\r\n" per header).
*/
struct CacheEntryRecord {
  std::string bucket;
  std::string request_key;

  int         status = 0;
  std::string headers;
  std::string body;

  uint64_t stored_at_ms = 0;
};

}
