#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/runtime/server.hpp"
#include "internal/util/errors.hpp"

using fieldsync::factory::BuildServer;
using fieldsync::runtime::GatewayHost;

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

static void Usage() {
  std::cerr << "Usage: fieldsync-server <config.yaml> [--seed-job <job_id> <scheduled_date>]...\n";
}

int main(int argc, char** argv) {
  if (argc < 2) {
    Usage();
    return 1;
  }

  std::string config_path = argv[1];

  struct Seed {
    std::string id;
    std::string date;
  };
  std::vector<Seed> seeds;
  for (int i = 2; i < argc; ++i) {
    if (std::string(argv[i]) == "--seed-job" && i + 2 < argc) {
      seeds.push_back({argv[i + 1], argv[i + 2]});
      i += 2;
      continue;
    }
    Usage();
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = fieldsync::config::ConfigLoader::LoadFromYaml(config_path);

    fieldsync::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = BuildServer(config);

    for (const auto& seed : seeds) {
      fieldsync::db::model::JobRecord job;
      job.id             = seed.id;
      job.scheduled_date = seed.date;
      try {
        app.lifecycle->CreateJob(job);
      } catch (const fieldsync::util::AlreadyExists&) {
        FIELDSYNC_LOG_INFO("seed job already present", {fieldsync::observability::StringField("job_id", seed.id)});
      }
    }

    // ------------------------------------------------------------
    // Start server
    // ------------------------------------------------------------
    GatewayHost server(config.server(), app.api);

    // Register signal handlers before starting server to avoid race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    server.Start();

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    FIELDSYNC_LOG_INFO("Shutting down fieldsync server");

    server.Stop();
    fieldsync::observability::ShutdownLogging();
  } catch (const std::exception& e) {
    FIELDSYNC_LOG_ERROR("Fatal error", {fieldsync::observability::StringField("error", e.what())});
    fieldsync::observability::ShutdownLogging();
    return 2;
  }

  return 0;
}
