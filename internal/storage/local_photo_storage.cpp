#include "local_photo_storage.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <fstream>
#include <sstream>
#include <stdexcept>

#include "internal/storage/common/path_utils.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/url.hpp"

namespace fieldsync::storage {

namespace {

void SyncFile(const std::filesystem::path& path) {
  int fd = ::open(path.c_str(), O_RDONLY);
  if (fd < 0) {
    throw std::runtime_error("open for fsync failed: " + path.string() + ": " + std::strerror(errno));
  }
  int rc = ::fsync(fd);
  ::close(fd);
  if (rc != 0) {
    throw std::runtime_error("fsync failed: " + path.string());
  }
}

} // namespace

std::string ExtensionForContentType(std::string_view content_type) {
  const auto type = util::ToLower(content_type);
  if (type == "image/jpeg" || type == "image/jpg") return ".jpg";
  if (type == "image/png") return ".png";
  if (type == "image/webp") return ".webp";
  return ".bin";
}

LocalPhotoStorage::LocalPhotoStorage(std::filesystem::path root, bool fsync) : root_(std::move(root)), fsync_(fsync) {
  std::filesystem::create_directories(root_);
}

std::filesystem::path LocalPhotoStorage::Resolve(const std::string& path) const {
  const std::filesystem::path relative(path);
  if (relative.is_absolute()) {
    throw util::InvalidArgument("photo path must be relative: " + path);
  }
  for (const auto& part : relative) {
    if (part == "..") throw util::InvalidArgument("photo path escapes storage root: " + path);
  }
  return root_ / relative;
}

/*
  Atomic write:
      write tmp -> flush -> (fsync) -> rename
*/
std::string LocalPhotoStorage::Write(const std::string& job_id, const std::string& photo_id,
                                     std::string_view content_type, const std::string& bytes) {
  const auto relative   = common::PhotoRelativePath(job_id, photo_id, ExtensionForContentType(content_type));
  const auto final_path = root_ / relative;
  const auto tmp_path   = std::filesystem::path(final_path.string() + ".tmp");

  std::filesystem::create_directories(final_path.parent_path());

  {
    std::ofstream out(tmp_path, std::ios::binary | std::ios::trunc);
    if (!out) throw std::runtime_error("cannot open " + tmp_path.string());
    out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    out.flush();
    if (!out) throw std::runtime_error("write failed: " + tmp_path.string());
  }

  if (fsync_) SyncFile(tmp_path);

  std::filesystem::rename(tmp_path, final_path);
  return relative.generic_string();
}

std::string LocalPhotoStorage::Read(const std::string& path) {
  const auto    full = Resolve(path);
  std::ifstream in(full, std::ios::binary);
  if (!in) throw util::NotFound("photo not found: " + path);

  std::ostringstream buffer;
  buffer << in.rdbuf();
  return buffer.str();
}

void LocalPhotoStorage::Remove(const std::string& path) {
  std::filesystem::remove(Resolve(path));
}

} // namespace fieldsync::storage
