#pragma once

#include <filesystem>

#include "internal/storage/photo_storage.hpp"

namespace fieldsync::storage {

/*
  Photos on the local filesystem.

  Properties:
    - atomic replace writes (tmp, flush, rename)
    - optional fsync before the rename
*/
class LocalPhotoStorage final : public PhotoStorage {
 public:
  explicit LocalPhotoStorage(std::filesystem::path root, bool fsync = true);

  std::string Write(const std::string& job_id, const std::string& photo_id, std::string_view content_type,
                    const std::string& bytes) override;

  std::string Read(const std::string& path) override;

  void Remove(const std::string& path) override;

  const std::filesystem::path& Root() const {
    return root_;
  }

 private:
  std::filesystem::path Resolve(const std::string& path) const;

  std::filesystem::path root_;
  bool                  fsync_;
};

} // namespace fieldsync::storage
