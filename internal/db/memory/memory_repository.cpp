#include "memory_repository.hpp"

#include <algorithm>

#include "memory_tx.hpp"

namespace fieldsync::db::memory {

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Queued operations
// ------------------------------------------------------------------

Result MemoryRepository::InsertOperation(Transaction& t, const model::QueuedOperationRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.operations.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, "operation " + r.id);
  for (const auto& [_, existing] : s.operations) {
    if (existing.sequence == r.sequence) return Result::Err(ErrorCode::ConstraintViolation, "duplicate sequence");
  }
  s.operations[r.id] = r;
  return Result::Ok();
}

std::optional<model::QueuedOperationRecord> MemoryRepository::GetOperation(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.operations.find(id);
  if (it == s.operations.end()) return std::nullopt;
  return it->second;
}

std::vector<model::QueuedOperationRecord> MemoryRepository::ListOperations(Transaction& t) {
  const auto&                                s = TX(t).View();
  std::vector<model::QueuedOperationRecord> records;
  records.reserve(s.operations.size());
  for (const auto& [_, record] : s.operations) {
    records.push_back(record);
  }
  std::sort(records.begin(), records.end(), [](const auto& a, const auto& b) { return a.sequence < b.sequence; });
  return records;
}

Result MemoryRepository::UpdateOperation(Transaction& t, const model::QueuedOperationRecord& r) {
  auto& s  = TX(t).Mutable();
  auto  it = s.operations.find(r.id);
  if (it == s.operations.end()) return Result::Err(ErrorCode::NotFound, "operation " + r.id);
  it->second = r;
  return Result::Ok();
}

Result MemoryRepository::DeleteOperation(Transaction& t, const std::string& id) {
  auto& s = TX(t).Mutable();
  if (s.operations.erase(id) == 0) return Result::Err(ErrorCode::NotFound, "operation " + id);
  return Result::Ok();
}

uint64_t MemoryRepository::MaxOperationSequence(Transaction& t) {
  uint64_t max_sequence = 0;
  for (const auto& [_, record] : TX(t).View().operations) {
    max_sequence = std::max(max_sequence, record.sequence);
  }
  return max_sequence;
}

// ------------------------------------------------------------------
// Response cache
// ------------------------------------------------------------------

Result MemoryRepository::PutCacheEntry(Transaction& t, const model::CacheEntryRecord& r) {
  TX(t).Mutable().cache[r.bucket][r.request_key] = r;
  return Result::Ok();
}

std::optional<model::CacheEntryRecord> MemoryRepository::GetCacheEntry(Transaction& t, const std::string& bucket,
                                                                       const std::string& request_key) {
  const auto& s         = TX(t).View();
  auto        bucket_it = s.cache.find(bucket);
  if (bucket_it == s.cache.end()) return std::nullopt;
  auto entry_it = bucket_it->second.find(request_key);
  if (entry_it == bucket_it->second.end()) return std::nullopt;
  return entry_it->second;
}

std::vector<std::string> MemoryRepository::ListCacheBuckets(Transaction& t) {
  std::vector<std::string> buckets;
  for (const auto& [bucket, entries] : TX(t).View().cache) {
    if (!entries.empty()) buckets.push_back(bucket);
  }
  return buckets;
}

Result MemoryRepository::DeleteCacheBucket(Transaction& t, const std::string& bucket) {
  TX(t).Mutable().cache.erase(bucket);
  return Result::Ok();
}

// ------------------------------------------------------------------
// Jobs
// ------------------------------------------------------------------

Result MemoryRepository::InsertJob(Transaction& t, const model::JobRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.jobs.contains(r.id)) return Result::Err(ErrorCode::AlreadyExists, "job " + r.id);
  s.jobs[r.id] = r;
  return Result::Ok();
}

std::optional<model::JobRecord> MemoryRepository::GetJob(Transaction& t, const std::string& id) {
  const auto& s  = TX(t).View();
  auto        it = s.jobs.find(id);
  if (it == s.jobs.end()) return std::nullopt;
  return it->second;
}

Result MemoryRepository::UpdateJob(Transaction& t, const model::JobRecord& r) {
  auto& s  = TX(t).Mutable();
  auto  it = s.jobs.find(r.id);
  if (it == s.jobs.end()) return Result::Err(ErrorCode::NotFound, "job " + r.id);
  it->second = r;
  return Result::Ok();
}

// ------------------------------------------------------------------
// Photos
// ------------------------------------------------------------------

Result MemoryRepository::InsertPhoto(Transaction& t, const model::PhotoRecord& r) {
  auto& s = TX(t).Mutable();
  for (const auto& existing : s.photos) {
    if (existing.id == r.id) return Result::Err(ErrorCode::AlreadyExists, "photo " + r.id);
    if (!r.idempotency_key.empty() && existing.idempotency_key == r.idempotency_key) {
      return Result::Err(ErrorCode::ConstraintViolation, "duplicate idempotency key " + r.idempotency_key);
    }
  }
  s.photos.push_back(r);
  return Result::Ok();
}

std::optional<model::PhotoRecord> MemoryRepository::GetPhotoByIdempotencyKey(Transaction& t, const std::string& key) {
  if (key.empty()) return std::nullopt;
  for (const auto& photo : TX(t).View().photos) {
    if (photo.idempotency_key == key) return photo;
  }
  return std::nullopt;
}

std::vector<model::PhotoRecord> MemoryRepository::ListPhotos(Transaction& t, const std::string& job_id) {
  std::vector<model::PhotoRecord> out;
  for (const auto& photo : TX(t).View().photos)
    if (photo.job_id == job_id) out.push_back(photo);
  std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.ordinal < b.ordinal; });
  return out;
}

// ------------------------------------------------------------------
// Audit
// ------------------------------------------------------------------

Result MemoryRepository::InsertAudit(Transaction& t, const model::AuditRecord& r) {
  TX(t).Mutable().audit.push_back(r);
  return Result::Ok();
}

std::vector<model::AuditRecord> MemoryRepository::ListAudit(Transaction& t, const std::string& job_id) {
  std::vector<model::AuditRecord> out;
  for (const auto& e : TX(t).View().audit)
    if (e.job_id == job_id) out.push_back(e);
  return out;
}

} // namespace fieldsync::db::memory
