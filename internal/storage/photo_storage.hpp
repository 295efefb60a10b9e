#pragma once

#include <memory>
#include <string>
#include <string_view>

namespace fieldsync::storage {

/*
  Blob store for uploaded photo bytes.

  Paths handed out by Write are opaque keys for Read and Remove; they
  are what the job's photo records persist.
*/
class PhotoStorage {
 public:
  virtual ~PhotoStorage() = default;

  // Atomic: a reader never observes a partially written photo.
  virtual std::string Write(const std::string& job_id, const std::string& photo_id, std::string_view content_type,
                            const std::string& bytes) = 0;

  virtual std::string Read(const std::string& path) = 0;

  virtual void Remove(const std::string& path) = 0;
};

using PhotoStoragePtr = std::shared_ptr<PhotoStorage>;

// ".jpg", ".png", ".webp", otherwise ".bin"
std::string ExtensionForContentType(std::string_view content_type);

} // namespace fieldsync::storage
