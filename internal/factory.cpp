#include "factory.hpp"

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/observability/logging.hpp"
#include "internal/storage/local_photo_storage.hpp"

namespace fieldsync::factory {

using namespace fieldsync;

namespace {

void BootstrapSqliteSchema(const std::shared_ptr<db::sqlite::SqliteDB>& sqlite_db) {
  static const std::vector<std::string> kBootstrapSql = {
      "CREATE TABLE IF NOT EXISTS queued_operation (id TEXT PRIMARY KEY, method TEXT NOT NULL, target_endpoint TEXT NOT NULL, resource_key TEXT NOT NULL, payload TEXT NOT NULL, state INTEGER NOT NULL, failure_kind INTEGER NOT NULL DEFAULT 0, sequence INTEGER NOT NULL UNIQUE, created_at_ms INTEGER NOT NULL, attempt_count INTEGER NOT NULL DEFAULT 0, last_attempt_at_ms INTEGER NOT NULL DEFAULT 0, last_error TEXT NOT NULL DEFAULT '');",
      "CREATE TABLE IF NOT EXISTS cache_entry (bucket TEXT NOT NULL, request_key TEXT NOT NULL, status INTEGER NOT NULL, headers TEXT NOT NULL, body BLOB NOT NULL, stored_at_ms INTEGER NOT NULL, PRIMARY KEY (bucket, request_key));",
      "CREATE TABLE IF NOT EXISTS job (id TEXT PRIMARY KEY, org_id TEXT NOT NULL, technician_id TEXT NOT NULL, status INTEGER NOT NULL, scheduled_date TEXT NOT NULL, started_at_ms INTEGER NOT NULL DEFAULT 0, completed_at_ms INTEGER NOT NULL DEFAULT 0, skip_reason TEXT NOT NULL DEFAULT '', notes TEXT NOT NULL DEFAULT '', version INTEGER NOT NULL DEFAULT 0);",
      "CREATE TABLE IF NOT EXISTS job_photo (id TEXT PRIMARY KEY, job_id TEXT NOT NULL REFERENCES job(id), idempotency_key TEXT UNIQUE, type INTEGER NOT NULL, content_type TEXT NOT NULL, storage_path TEXT NOT NULL, size_bytes INTEGER NOT NULL, uploaded_at_ms INTEGER NOT NULL, uploaded_by TEXT NOT NULL, ordinal INTEGER NOT NULL);",
      "CREATE TABLE IF NOT EXISTS job_audit (seq INTEGER PRIMARY KEY AUTOINCREMENT, job_id TEXT NOT NULL REFERENCES job(id), previous_status INTEGER NOT NULL, new_status INTEGER NOT NULL, actor TEXT NOT NULL, at_ms INTEGER NOT NULL, skip_reason TEXT NOT NULL DEFAULT '', operation_id TEXT NOT NULL DEFAULT '');",
      "CREATE INDEX IF NOT EXISTS job_photo_job ON job_photo(job_id, ordinal);",
      "CREATE INDEX IF NOT EXISTS job_audit_job ON job_audit(job_id, seq);"};

  for (const auto& sql : kBootstrapSql) {
    sqlite_db->Exec(sql);
  }

  sqlite_db->Exec("SELECT id,method,target_endpoint,resource_key,payload,state,failure_kind,sequence FROM queued_operation LIMIT 1;");
  sqlite_db->Exec("SELECT bucket,request_key,status,headers,body,stored_at_ms FROM cache_entry LIMIT 1;");
  sqlite_db->Exec("SELECT id,org_id,technician_id,status,version FROM job LIMIT 1;");
}

lifecycle::PhotoPolicy ToPhotoPolicy(const fieldsync::runtime::config::ServerConfig& server) {
  lifecycle::PhotoPolicy policy;
  policy.max_bytes = server.max_photo_bytes();
  policy.allowed_content_types.assign(server.allowed_content_types().begin(), server.allowed_content_types().end());
  return policy;
}

} // namespace

std::shared_ptr<db::Repository> BuildRepository(const fieldsync::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
    db::sqlite::SqliteOptions options;
    options.wal_mode         = !database.sqlite().has_wal_mode() || database.sqlite().wal_mode();
    options.synchronous_full = database.sqlite().synchronous_full();

    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(), options);
    BootstrapSqliteSchema(sqlite_db);
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
  }

  return std::make_shared<db::memory::MemoryRepository>();
}

/*
    Server dependency graph
*/
ServerApplication BuildServer(const fieldsync::runtime::config::RuntimeConfig& config) {
  ServerApplication app;

  app.repository = BuildRepository(config);

  auto photos   = std::make_shared<storage::LocalPhotoStorage>(config.server().photo_dir());
  app.lifecycle = std::make_shared<lifecycle::JobLifecycle>(app.repository, photos, ToPhotoPolicy(config.server()));
  app.api       = std::make_shared<api::FieldApi>(app.lifecycle);

  return app;
}

/*
    Client dependency graph
*/
ClientApplication BuildClient(const fieldsync::runtime::config::RuntimeConfig& config,
                              std::shared_ptr<transport::Transport> transport) {
  if (!transport) {
    throw std::invalid_argument("client requires a transport");
  }

  ClientApplication app;
  app.repository = BuildRepository(config);
  app.queue      = std::make_shared<queue::QueueStore>(app.repository);
  app.bridge     = std::make_shared<notify::NotificationBridge>();

  // ------------------------------------------------------------------
  // Cache routing
  // ------------------------------------------------------------------
  const auto& cache_config = config.cache();
  auto cache_store = std::make_shared<cache::CacheStore>(app.repository, cache_config.bucket_prefix(), cache_config.version());
  app.router       = std::make_shared<cache::CacheRouter>(std::move(transport), cache_store,
                                                          cache::RoutingRules::FromConfig(cache_config),
                                                          cache_config.offline_fallback_url(),
                                                          std::chrono::milliseconds(cache_config.network_timeout_ms()));

  // ------------------------------------------------------------------
  // Replay
  // ------------------------------------------------------------------
  replay::ReplayOptions replay_options;
  replay_options.max_attempts    = config.replay().max_attempts();
  replay_options.attempt_timeout = std::chrono::milliseconds(config.replay().attempt_timeout_ms());
  replay_options.actor_id        = config.client().actor_id();
  if (replay_options.actor_id.empty()) {
    FIELDSYNC_LOG_WARN("client.actor_id is not set; the server will reject replayed writes");
  }
  app.coordinator = std::make_shared<replay::ReplayCoordinator>(app.queue, app.router, app.bridge, replay_options);

  core::SyncEngineOptions engine_options;
  if (config.replay().poll_interval_ms() > 0) {
    engine_options.poll_interval = std::chrono::milliseconds(config.replay().poll_interval_ms());
  }
  app.engine = std::make_shared<core::SyncEngine>(app.queue, app.router, app.coordinator, app.bridge, engine_options);

  return app;
}

} // namespace fieldsync::factory
