#pragma once

#include <memory>

#include "config/config.pb.h"

#include "internal/api/field_api.hpp"
#include "internal/cache/cache_router.hpp"
#include "internal/core/sync_engine.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/lifecycle/job_lifecycle.hpp"
#include "internal/transport/transport.hpp"

namespace fieldsync::factory {

/*
  Composition root.

  The ONLY place allowed to know concrete DB and storage types.
  Everything built here lives for the lifetime of the process.
*/

struct ServerApplication {
  std::shared_ptr<db::Repository>          repository;
  std::shared_ptr<lifecycle::JobLifecycle> lifecycle;
  std::shared_ptr<api::FieldApi>           api;
};

struct ClientApplication {
  std::shared_ptr<db::Repository>             repository;
  std::shared_ptr<queue::QueueStore>          queue;
  std::shared_ptr<cache::CacheRouter>         router;
  std::shared_ptr<notify::NotificationBridge> bridge;
  std::shared_ptr<replay::ReplayCoordinator>  coordinator;
  std::shared_ptr<core::SyncEngine>           engine;
};

// SQLite (schema bootstrapped) or in-memory, per database config.
std::shared_ptr<db::Repository> BuildRepository(const fieldsync::runtime::config::RuntimeConfig& config);

ServerApplication BuildServer(const fieldsync::runtime::config::RuntimeConfig& config);

// The engine is built but not started.
ClientApplication BuildClient(const fieldsync::runtime::config::RuntimeConfig& config,
                              std::shared_ptr<transport::Transport> transport);

} // namespace fieldsync::factory
