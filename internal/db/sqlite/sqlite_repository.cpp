#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <stdexcept>

namespace fieldsync::db::sqlite {

using fieldsync::db::ErrorCode;
using fieldsync::db::Result;
using fieldsync::model::FailureKind;
using fieldsync::model::JobStatus;
using fieldsync::model::OperationState;
using fieldsync::model::PhotoType;

static void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
    sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

static void BindTextOrNull(sqlite3_stmt* st, int idx, const std::string& s) {
    if (s.empty()) {
        sqlite3_bind_null(st, idx);
    } else {
        BindText(st, idx, s);
    }
}

static void BindBlob(sqlite3_stmt* st, int idx, const std::string& bytes) {
    sqlite3_bind_blob(st, idx, bytes.data(), static_cast<int>(bytes.size()), SQLITE_TRANSIENT);
}

static void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

static void BindI32(sqlite3_stmt* st, int idx, int v) {
    sqlite3_bind_int(st, idx, v);
}

static std::string ColText(sqlite3_stmt* st, int col) {
    const unsigned char* t = sqlite3_column_text(st, col);
    return t ? reinterpret_cast<const char*>(t) : "";
}

static std::string ColBlob(sqlite3_stmt* st, int col) {
    const void* data = sqlite3_column_blob(st, col);
    int         size = sqlite3_column_bytes(st, col);
    return data ? std::string(static_cast<const char*>(data), static_cast<size_t>(size)) : std::string();
}

static uint64_t ColU64(sqlite3_stmt* st, int col) {
    return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

static int ColI32(sqlite3_stmt* st, int col) {
    return sqlite3_column_int(st, col);
}

// Reads have no Result channel; a statement that fails to prepare is a bug
// or a broken database, so it surfaces as an exception.
static sqlite3_stmt* PrepareOrThrow(sqlite3* db, const char* sql) {
    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK) {
        throw std::runtime_error(std::string("sqlite prepare: ") + sqlite3_errmsg(db));
    }
    return st;
}

static void StepFailed(sqlite3* db, sqlite3_stmt* st, int rc) {
    if (rc == SQLITE_DONE || rc == SQLITE_ROW) return;
    std::string msg = sqlite3_errmsg(db);
    sqlite3_finalize(st);
    throw std::runtime_error("sqlite step: " + msg);
}

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db)
    : db_(std::move(db)) {}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
    return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
    return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
    if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW)
        return Result::Ok();

    switch (rc & 0xff) {
        case SQLITE_BUSY:
        case SQLITE_LOCKED:
            return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
        case SQLITE_CONSTRAINT:
            return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
        case SQLITE_IOERR:
            return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
        case SQLITE_CORRUPT:
            return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
        default:
            return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
    }
}

// ------------------------------------------------------------------
// Queued operations
// ------------------------------------------------------------------

static constexpr const char* kOperationColumns =
    "id,method,target_endpoint,resource_key,payload,state,failure_kind,sequence,"
    "created_at_ms,attempt_count,last_attempt_at_ms,last_error";

static model::QueuedOperationRecord ReadOperation(sqlite3_stmt* st) {
    model::QueuedOperationRecord r;
    r.id                 = ColText(st, 0);
    r.method             = ColText(st, 1);
    r.target_endpoint    = ColText(st, 2);
    r.resource_key       = ColText(st, 3);
    r.payload            = ColText(st, 4);
    r.state              = static_cast<OperationState>(ColI32(st, 5));
    r.failure_kind       = static_cast<FailureKind>(ColI32(st, 6));
    r.sequence           = ColU64(st, 7);
    r.created_at_ms      = ColU64(st, 8);
    r.attempt_count      = static_cast<uint32_t>(ColU64(st, 9));
    r.last_attempt_at_ms = ColU64(st, 10);
    r.last_error         = ColText(st, 11);
    return r;
}

Result SqliteRepository::InsertOperation(Transaction& t, const model::QueuedOperationRecord& r) {
    auto* db = TX(t).Handle();

    const char* sql =
        "INSERT INTO queued_operation(id,method,target_endpoint,resource_key,payload,state,failure_kind,"
        "sequence,created_at_ms,attempt_count,last_attempt_at_ms,last_error) VALUES(?,?,?,?,?,?,?,?,?,?,?,?);";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, r.id);
    BindText(st, 2, r.method);
    BindText(st, 3, r.target_endpoint);
    BindText(st, 4, r.resource_key);
    BindText(st, 5, r.payload);
    BindI32(st, 6, static_cast<int>(r.state));
    BindI32(st, 7, static_cast<int>(r.failure_kind));
    BindU64(st, 8, r.sequence);
    BindU64(st, 9, r.created_at_ms);
    BindU64(st, 10, r.attempt_count);
    BindU64(st, 11, r.last_attempt_at_ms);
    BindText(st, 12, r.last_error);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    if ((rc & 0xff) == SQLITE_CONSTRAINT)
        return Result::Err(ErrorCode::AlreadyExists, sqlite3_errmsg(db));
    return Translate(db, rc);
}

std::optional<model::QueuedOperationRecord>
SqliteRepository::GetOperation(Transaction& t, const std::string& id) {
    auto* db = TX(t).Handle();

    const std::string sql = std::string("SELECT ") + kOperationColumns + " FROM queued_operation WHERE id=?;";
    sqlite3_stmt* st = PrepareOrThrow(db, sql.c_str());
    BindText(st, 1, id);

    int rc = sqlite3_step(st);
    StepFailed(db, st, rc);
    if (rc != SQLITE_ROW) {
        sqlite3_finalize(st);
        return std::nullopt;
    }

    auto r = ReadOperation(st);
    sqlite3_finalize(st);
    return r;
}

std::vector<model::QueuedOperationRecord> SqliteRepository::ListOperations(Transaction& t) {
    auto* db = TX(t).Handle();

    const std::string sql = std::string("SELECT ") + kOperationColumns + " FROM queued_operation ORDER BY sequence ASC;";
    sqlite3_stmt* st = PrepareOrThrow(db, sql.c_str());

    std::vector<model::QueuedOperationRecord> out;
    int rc;
    while ((rc = sqlite3_step(st)) == SQLITE_ROW) {
        out.push_back(ReadOperation(st));
    }
    StepFailed(db, st, rc);
    sqlite3_finalize(st);
    return out;
}

Result SqliteRepository::UpdateOperation(Transaction& t, const model::QueuedOperationRecord& r) {
    auto* db = TX(t).Handle();

    const char* sql =
        "UPDATE queued_operation SET method=?,target_endpoint=?,resource_key=?,payload=?,state=?,failure_kind=?,"
        "sequence=?,created_at_ms=?,attempt_count=?,last_attempt_at_ms=?,last_error=? WHERE id=?;";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, r.method);
    BindText(st, 2, r.target_endpoint);
    BindText(st, 3, r.resource_key);
    BindText(st, 4, r.payload);
    BindI32(st, 5, static_cast<int>(r.state));
    BindI32(st, 6, static_cast<int>(r.failure_kind));
    BindU64(st, 7, r.sequence);
    BindU64(st, 8, r.created_at_ms);
    BindU64(st, 9, r.attempt_count);
    BindU64(st, 10, r.last_attempt_at_ms);
    BindText(st, 11, r.last_error);
    BindText(st, 12, r.id);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    if (rc == SQLITE_DONE && sqlite3_changes(db) == 0)
        return Result::Err(ErrorCode::NotFound, "operation " + r.id);
    return Translate(db, rc);
}

Result SqliteRepository::DeleteOperation(Transaction& t, const std::string& id) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, "DELETE FROM queued_operation WHERE id=?;", -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, id);
    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    if (rc == SQLITE_DONE && sqlite3_changes(db) == 0)
        return Result::Err(ErrorCode::NotFound, "operation " + id);
    return Translate(db, rc);
}

uint64_t SqliteRepository::MaxOperationSequence(Transaction& t) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* st = PrepareOrThrow(db, "SELECT COALESCE(MAX(sequence),0) FROM queued_operation;");
    int rc = sqlite3_step(st);
    StepFailed(db, st, rc);
    uint64_t max_sequence = rc == SQLITE_ROW ? ColU64(st, 0) : 0;
    sqlite3_finalize(st);
    return max_sequence;
}

// ------------------------------------------------------------------
// Response cache
// ------------------------------------------------------------------

Result SqliteRepository::PutCacheEntry(Transaction& t, const model::CacheEntryRecord& r) {
    auto* db = TX(t).Handle();

    const char* sql =
        "INSERT INTO cache_entry(bucket,request_key,status,headers,body,stored_at_ms) VALUES(?,?,?,?,?,?) "
        "ON CONFLICT(bucket,request_key) DO UPDATE SET status=excluded.status,headers=excluded.headers,"
        "body=excluded.body,stored_at_ms=excluded.stored_at_ms;";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, r.bucket);
    BindText(st, 2, r.request_key);
    BindI32(st, 3, r.status);
    BindText(st, 4, r.headers);
    BindBlob(st, 5, r.body);
    BindU64(st, 6, r.stored_at_ms);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);
    return Translate(db, rc);
}

std::optional<model::CacheEntryRecord> SqliteRepository::GetCacheEntry(Transaction& t, const std::string& bucket,
                                                                       const std::string& request_key) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* st = PrepareOrThrow(
        db, "SELECT status,headers,body,stored_at_ms FROM cache_entry WHERE bucket=? AND request_key=?;");
    BindText(st, 1, bucket);
    BindText(st, 2, request_key);

    int rc = sqlite3_step(st);
    StepFailed(db, st, rc);
    if (rc != SQLITE_ROW) {
        sqlite3_finalize(st);
        return std::nullopt;
    }

    model::CacheEntryRecord r;
    r.bucket       = bucket;
    r.request_key  = request_key;
    r.status       = ColI32(st, 0);
    r.headers      = ColText(st, 1);
    r.body         = ColBlob(st, 2);
    r.stored_at_ms = ColU64(st, 3);

    sqlite3_finalize(st);
    return r;
}

std::vector<std::string> SqliteRepository::ListCacheBuckets(Transaction& t) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* st = PrepareOrThrow(db, "SELECT DISTINCT bucket FROM cache_entry ORDER BY bucket;");

    std::vector<std::string> out;
    int rc;
    while ((rc = sqlite3_step(st)) == SQLITE_ROW) {
        out.push_back(ColText(st, 0));
    }
    StepFailed(db, st, rc);
    sqlite3_finalize(st);
    return out;
}

Result SqliteRepository::DeleteCacheBucket(Transaction& t, const std::string& bucket) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, "DELETE FROM cache_entry WHERE bucket=?;", -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, bucket);
    int rc = sqlite3_step(st);
    sqlite3_finalize(st);
    return Translate(db, rc);
}

// ------------------------------------------------------------------
// Jobs
// ------------------------------------------------------------------

Result SqliteRepository::InsertJob(Transaction& t, const model::JobRecord& r) {
    auto* db = TX(t).Handle();

    const char* sql =
        "INSERT INTO job(id,org_id,technician_id,status,scheduled_date,started_at_ms,completed_at_ms,"
        "skip_reason,notes,version) VALUES(?,?,?,?,?,?,?,?,?,?);";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, r.id);
    BindText(st, 2, r.org_id);
    BindText(st, 3, r.technician_id);
    BindI32(st, 4, static_cast<int>(r.status));
    BindText(st, 5, r.scheduled_date);
    BindU64(st, 6, r.started_at_ms);
    BindU64(st, 7, r.completed_at_ms);
    BindText(st, 8, r.skip_reason);
    BindText(st, 9, r.notes);
    BindU64(st, 10, r.version);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    if ((rc & 0xff) == SQLITE_CONSTRAINT)
        return Result::Err(ErrorCode::AlreadyExists, "job " + r.id);
    return Translate(db, rc);
}

std::optional<model::JobRecord> SqliteRepository::GetJob(Transaction& t, const std::string& id) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* st = PrepareOrThrow(
        db,
        "SELECT id,org_id,technician_id,status,scheduled_date,started_at_ms,completed_at_ms,skip_reason,notes,version "
        "FROM job WHERE id=?;");
    BindText(st, 1, id);

    int rc = sqlite3_step(st);
    StepFailed(db, st, rc);
    if (rc != SQLITE_ROW) {
        sqlite3_finalize(st);
        return std::nullopt;
    }

    model::JobRecord r;
    r.id              = ColText(st, 0);
    r.org_id          = ColText(st, 1);
    r.technician_id   = ColText(st, 2);
    r.status          = static_cast<JobStatus>(ColI32(st, 3));
    r.scheduled_date  = ColText(st, 4);
    r.started_at_ms   = ColU64(st, 5);
    r.completed_at_ms = ColU64(st, 6);
    r.skip_reason     = ColText(st, 7);
    r.notes           = ColText(st, 8);
    r.version         = ColU64(st, 9);

    sqlite3_finalize(st);
    return r;
}

Result SqliteRepository::UpdateJob(Transaction& t, const model::JobRecord& r) {
    auto* db = TX(t).Handle();

    const char* sql =
        "UPDATE job SET org_id=?,technician_id=?,status=?,scheduled_date=?,started_at_ms=?,completed_at_ms=?,"
        "skip_reason=?,notes=?,version=? WHERE id=?;";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, r.org_id);
    BindText(st, 2, r.technician_id);
    BindI32(st, 3, static_cast<int>(r.status));
    BindText(st, 4, r.scheduled_date);
    BindU64(st, 5, r.started_at_ms);
    BindU64(st, 6, r.completed_at_ms);
    BindText(st, 7, r.skip_reason);
    BindText(st, 8, r.notes);
    BindU64(st, 9, r.version);
    BindText(st, 10, r.id);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);

    if (rc == SQLITE_DONE && sqlite3_changes(db) == 0)
        return Result::Err(ErrorCode::NotFound, "job " + r.id);
    return Translate(db, rc);
}

// ------------------------------------------------------------------
// Photos
// ------------------------------------------------------------------

static constexpr const char* kPhotoColumns =
    "id,job_id,idempotency_key,type,content_type,storage_path,size_bytes,uploaded_at_ms,uploaded_by,ordinal";

static model::PhotoRecord ReadPhoto(sqlite3_stmt* st) {
    model::PhotoRecord r;
    r.id              = ColText(st, 0);
    r.job_id          = ColText(st, 1);
    r.idempotency_key = ColText(st, 2);
    r.type            = static_cast<PhotoType>(ColI32(st, 3));
    r.content_type    = ColText(st, 4);
    r.storage_path    = ColText(st, 5);
    r.size_bytes      = ColU64(st, 6);
    r.uploaded_at_ms  = ColU64(st, 7);
    r.uploaded_by     = ColText(st, 8);
    r.ordinal         = ColU64(st, 9);
    return r;
}

Result SqliteRepository::InsertPhoto(Transaction& t, const model::PhotoRecord& r) {
    auto* db = TX(t).Handle();

    const char* sql =
        "INSERT INTO job_photo(id,job_id,idempotency_key,type,content_type,storage_path,size_bytes,"
        "uploaded_at_ms,uploaded_by,ordinal) VALUES(?,?,?,?,?,?,?,?,?,?);";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, r.id);
    BindText(st, 2, r.job_id);
    BindTextOrNull(st, 3, r.idempotency_key);
    BindI32(st, 4, static_cast<int>(r.type));
    BindText(st, 5, r.content_type);
    BindText(st, 6, r.storage_path);
    BindU64(st, 7, r.size_bytes);
    BindU64(st, 8, r.uploaded_at_ms);
    BindText(st, 9, r.uploaded_by);
    BindU64(st, 10, r.ordinal);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);
    return Translate(db, rc);
}

std::optional<model::PhotoRecord> SqliteRepository::GetPhotoByIdempotencyKey(Transaction& t, const std::string& key) {
    if (key.empty()) return std::nullopt;

    auto* db = TX(t).Handle();

    const std::string sql = std::string("SELECT ") + kPhotoColumns + " FROM job_photo WHERE idempotency_key=?;";
    sqlite3_stmt* st = PrepareOrThrow(db, sql.c_str());
    BindText(st, 1, key);

    int rc = sqlite3_step(st);
    StepFailed(db, st, rc);
    if (rc != SQLITE_ROW) {
        sqlite3_finalize(st);
        return std::nullopt;
    }

    auto r = ReadPhoto(st);
    sqlite3_finalize(st);
    return r;
}

std::vector<model::PhotoRecord> SqliteRepository::ListPhotos(Transaction& t, const std::string& job_id) {
    auto* db = TX(t).Handle();

    const std::string sql =
        std::string("SELECT ") + kPhotoColumns + " FROM job_photo WHERE job_id=? ORDER BY ordinal ASC;";
    sqlite3_stmt* st = PrepareOrThrow(db, sql.c_str());
    BindText(st, 1, job_id);

    std::vector<model::PhotoRecord> out;
    int rc;
    while ((rc = sqlite3_step(st)) == SQLITE_ROW) {
        out.push_back(ReadPhoto(st));
    }
    StepFailed(db, st, rc);
    sqlite3_finalize(st);
    return out;
}

// ------------------------------------------------------------------
// Audit
// ------------------------------------------------------------------

Result SqliteRepository::InsertAudit(Transaction& t, const model::AuditRecord& r) {
    auto* db = TX(t).Handle();

    const char* sql =
        "INSERT INTO job_audit(job_id,previous_status,new_status,actor,at_ms,skip_reason,operation_id) "
        "VALUES(?,?,?,?,?,?,?);";

    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql, -1, &st, nullptr) != SQLITE_OK)
        return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));

    BindText(st, 1, r.job_id);
    BindI32(st, 2, static_cast<int>(r.previous_status));
    BindI32(st, 3, static_cast<int>(r.new_status));
    BindText(st, 4, r.actor);
    BindU64(st, 5, r.at_ms);
    BindText(st, 6, r.skip_reason);
    BindText(st, 7, r.operation_id);

    int rc = sqlite3_step(st);
    sqlite3_finalize(st);
    return Translate(db, rc);
}

std::vector<model::AuditRecord> SqliteRepository::ListAudit(Transaction& t, const std::string& job_id) {
    auto* db = TX(t).Handle();

    sqlite3_stmt* st = PrepareOrThrow(
        db,
        "SELECT job_id,previous_status,new_status,actor,at_ms,skip_reason,operation_id FROM job_audit "
        "WHERE job_id=? ORDER BY seq ASC;");
    BindText(st, 1, job_id);

    std::vector<model::AuditRecord> out;
    int rc;
    while ((rc = sqlite3_step(st)) == SQLITE_ROW) {
        model::AuditRecord r;
        r.job_id          = ColText(st, 0);
        r.previous_status = static_cast<JobStatus>(ColI32(st, 1));
        r.new_status      = static_cast<JobStatus>(ColI32(st, 2));
        r.actor           = ColText(st, 3);
        r.at_ms           = ColU64(st, 4);
        r.skip_reason     = ColText(st, 5);
        r.operation_id    = ColText(st, 6);
        out.push_back(std::move(r));
    }
    StepFailed(db, st, rc);
    sqlite3_finalize(st);
    return out;
}

} // namespace fieldsync::db::sqlite
