#pragma once

#include <chrono>
#include <memory>
#include <string>
#include <thread>

#include "config/config.pb.h"
#include "internal/cache/cache_router.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/core/sync_engine.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "support/loopback_transport.hpp"

namespace fieldsync::testing {

/*
  A field client wired to an in-process server through a
  LoopbackTransport. Memory storage unless a repository is given.
*/
struct ClientStack {
  explicit ClientStack(FakeServer& server, std::shared_ptr<db::Repository> repository = nullptr,
                       core::SyncEngineOptions engine_options = {}) {
    if (!repository) repository = std::make_shared<db::memory::MemoryRepository>();

    runtime::config::RuntimeConfig config;
    config::ConfigLoader::ApplyDefaults(config);

    transport = std::make_shared<LoopbackTransport>(server.api);
    queue     = std::make_shared<queue::QueueStore>(repository);
    bridge    = std::make_shared<notify::NotificationBridge>();
    router    = std::make_shared<cache::CacheRouter>(
        transport, std::make_shared<cache::CacheStore>(repository, "fieldsync", "v1"),
        cache::RoutingRules::FromConfig(config.cache()), "/app/field", std::chrono::milliseconds(1000));

    replay::ReplayOptions options;
    options.max_attempts = 3;
    options.actor_id     = "tech-1";
    coordinator          = std::make_shared<replay::ReplayCoordinator>(queue, router, bridge, options);
    engine = std::make_shared<core::SyncEngine>(queue, router, coordinator, bridge, engine_options);
  }

  // Polls until the queue has no records or the timeout passes.
  bool WaitForEmptyQueue(std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
      if (queue->ListAll().empty()) return true;
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return queue->ListAll().empty();
  }

  std::shared_ptr<LoopbackTransport>          transport;
  std::shared_ptr<queue::QueueStore>          queue;
  std::shared_ptr<notify::NotificationBridge> bridge;
  std::shared_ptr<cache::CacheRouter>         router;
  std::shared_ptr<replay::ReplayCoordinator>  coordinator;
  std::shared_ptr<core::SyncEngine>           engine;
};

} // namespace fieldsync::testing
