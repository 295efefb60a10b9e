#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/model/job_status.hpp"
#include "internal/model/operation_state.hpp"
#include "internal/observability/logging.hpp"
#include "internal/transport/grpc_transport.hpp"
#include "internal/util/time.hpp"
#include "internal/util/url.hpp"

using namespace fieldsync;

static void Usage() {
  std::cout << "Usage:\n"
            << "  fieldsyncctl <config.yaml> status [PENDING|IN_FLIGHT|DEAD_LETTER]\n"
            << "  fieldsyncctl <config.yaml> photo <job_id> <before|after|issue> <file> [content_type]\n"
            << "  fieldsyncctl <config.yaml> transition <job_id> <en_route|start|complete|skip|STATUS> [skip_reason] [notes]\n"
            << "  fieldsyncctl <config.yaml> cancel <operation_id>\n"
            << "  fieldsyncctl <config.yaml> retry <operation_id>\n"
            << "  fieldsyncctl <config.yaml> discard <operation_id>\n"
            << "  fieldsyncctl <config.yaml> drain\n"
            << "  fieldsyncctl <config.yaml> fetch <url> [navigate]\n"
            << "  fieldsyncctl <config.yaml> precache\n";
}

static std::string ReadFile(const std::string& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    std::cerr << "cannot read " << path << "\n";
    std::exit(1);
  }
  std::ostringstream buffer;
  buffer << in.rdbuf();
  return buffer.str();
}

static std::string GuessContentType(const std::string& path) {
  const auto lowered = util::ToLower(path);
  if (util::EndsWith(lowered, ".png")) return "image/png";
  if (util::EndsWith(lowered, ".webp")) return "image/webp";
  return "image/jpeg";
}

static std::string BaseName(const std::string& path) {
  auto slash = path.find_last_of('/');
  return slash == std::string::npos ? path : path.substr(slash + 1);
}

static void PrintStatus(const core::QueueStatus& status, std::optional<model::OperationState> filter) {
  std::cout << "pending=" << status.pending << " in_flight=" << status.in_flight
            << " dead_letter=" << status.dead_letter << "\n";
  for (const auto& op : status.operations) {
    if (filter && op.state != *filter) continue;
    std::cout << op.id << "  " << model::ToString(op.state) << "  " << op.endpoint << "  attempts=" << op.attempt_count
              << "  queued=" << util::FormatUnixMillis(op.created_at_ms);
    if (op.failure_kind != model::FailureKind::kNone) {
      std::cout << "  failure=" << model::ToString(op.failure_kind);
    }
    if (!op.last_error.empty()) {
      std::cout << "  error=\"" << op.last_error << "\"";
    }
    std::cout << "\n";
  }
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  const std::string config_path = argv[1];
  const std::string cmd         = argv[2];

  try {
    auto config = config::ConfigLoader::LoadFromYaml(config_path);
    observability::InitializeLogging(config);

    auto transport = transport::GrpcTransport::Connect(config.client().server_address());
    auto app       = factory::BuildClient(config, transport);
    auto& engine   = *app.engine;

    // ------------------------------------------------------------

    if (cmd == "status") {
      std::optional<model::OperationState> filter;
      if (argc >= 4) {
        filter = model::ParseOperationState(argv[3]);
        if (!filter) {
          std::cerr << "unknown state: " << argv[3] << "\n";
          return 1;
        }
      }
      PrintStatus(engine.QueryQueueStatus(), filter);
      return 0;
    }

    if (cmd == "photo") {
      if (argc < 6) {
        Usage();
        return 1;
      }
      auto type = model::ParsePhotoType(argv[4]);
      if (!type) {
        std::cerr << "unknown photo type: " << argv[4] << "\n";
        return 1;
      }
      const std::string path = argv[5];

      codec::Blob blob;
      blob.filename     = BaseName(path);
      blob.content_type = argc >= 7 ? argv[6] : GuessContentType(path);
      blob.data         = ReadFile(path);

      std::cout << engine.EnqueuePhoto(argv[3], *type, std::move(blob)) << "\n";
      return 0;
    }

    if (cmd == "transition") {
      if (argc < 5) {
        Usage();
        return 1;
      }
      auto target = model::StatusForAction(argv[4]);
      if (!target) target = model::ParseJobStatus(argv[4]);
      if (!target) {
        std::cerr << "unknown action or status: " << argv[4] << "\n";
        return 1;
      }
      const std::string          skip_reason = argc >= 6 ? argv[5] : "";
      std::optional<std::string> notes;
      if (argc >= 7) notes = argv[6];

      std::cout << engine.EnqueueTransition(argv[3], *target, skip_reason, notes) << "\n";
      return 0;
    }

    if (cmd == "cancel" || cmd == "retry" || cmd == "discard") {
      if (argc < 4) {
        Usage();
        return 1;
      }
      if (cmd == "cancel") engine.Cancel(argv[3]);
      if (cmd == "retry") engine.RetryDeadLetter(argv[3]);
      if (cmd == "discard") engine.DiscardDeadLetter(argv[3]);
      std::cout << "ok\n";
      return 0;
    }

    if (cmd == "drain") {
      app.queue->RecoverInFlight();
      auto report = engine.DrainNow();
      std::cout << "delivered=" << report.delivered << " retried=" << report.retried
                << " dead_lettered=" << report.dead_lettered << " quarantined=" << report.quarantined
                << " held_back=" << report.held_back << " store_errors=" << report.store_errors << "\n";
      return 0;
    }

    if (cmd == "fetch") {
      if (argc < 4) {
        Usage();
        return 1;
      }
      transport::Request request;
      request.url        = argv[3];
      request.navigation = argc >= 5 && std::string(argv[4]) == "navigate";

      auto response = engine.Fetch(request);
      std::cerr << "HTTP " << response.status << "\n";
      std::cout << response.body << "\n";
      return response.Ok() ? 0 : 3;
    }

    if (cmd == "precache") {
      app.router->Activate();
      const auto& urls = config.cache().precache_urls();
      std::cout << "stored " << engine.Precache({urls.begin(), urls.end()}) << " of " << urls.size() << "\n";
      return 0;
    }

    Usage();
    return 1;
  } catch (const std::exception& e) {
    std::cerr << "error: " << e.what() << "\n";
    observability::ShutdownLogging();
    return 2;
  }
}
