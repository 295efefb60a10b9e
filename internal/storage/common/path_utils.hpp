#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>

namespace fieldsync::storage::common {

inline void ValidatePathComponent(const std::string& component, const char* what) {
  if (component.empty()) {
    throw std::invalid_argument(std::string(what) + " must not be empty");
  }
  for (char c : component) {
    if (c == '/' || c == '\\' || c == '\0') {
      throw std::invalid_argument(std::string(what) + " contains invalid character");
    }
  }
  if (component == "." || component == "..") {
    throw std::invalid_argument(std::string(what) + " must not be a relative path component");
  }
}

// <job id>/<photo id><extension>, relative to the storage root
inline std::filesystem::path PhotoRelativePath(const std::string& job_id, const std::string& photo_id,
                                               const std::string& extension) {
  ValidatePathComponent(job_id, "job id");
  ValidatePathComponent(photo_id, "photo id");
  return std::filesystem::path(job_id) / (photo_id + extension);
}

} // namespace fieldsync::storage::common
