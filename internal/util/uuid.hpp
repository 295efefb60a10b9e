#pragma once

#include <string>

namespace fieldsync::util {

// Random RFC4122 version 4 id in canonical 8-4-4-4-12 lowercase form.
// Used for operation, photo and job ids and multipart boundaries.
std::string NewId();

} // namespace fieldsync::util
