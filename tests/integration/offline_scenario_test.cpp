#include <cassert>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "config/config.pb.h"
#include "internal/codec/upload_codec.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/util/errors.hpp"
#include "support/loopback_transport.hpp"

namespace {

using fieldsync::codec::Blob;
using fieldsync::model::FailureKind;
using fieldsync::model::JobStatus;
using fieldsync::model::OperationState;
using fieldsync::model::PhotoType;
using fieldsync::notify::Event;
using fieldsync::notify::EventKind;
using fieldsync::testing::FakeServer;
using fieldsync::testing::LoopbackTransport;

std::string TempDbPath(const std::string& name) {
  const auto dir = std::filesystem::temp_directory_path() / "fieldsync_offline_scenarios";
  std::filesystem::create_directories(dir);
  const auto path = dir / (name + ".db");
  for (const char* suffix : {"", "-wal", "-shm"}) {
    std::filesystem::remove(path.string() + suffix);
  }
  return path.string();
}

fieldsync::runtime::config::RuntimeConfig ClientConfig(const std::string& db_path) {
  fieldsync::runtime::config::RuntimeConfig config;
  config.mutable_database()->mutable_sqlite()->set_path(db_path);
  config.mutable_client()->set_actor_id("tech-7");
  config.mutable_replay()->set_max_attempts(3);
  fieldsync::config::ConfigLoader::ApplyDefaults(config);
  return config;
}

struct Device {
  Device(FakeServer& server, const std::string& db_path)
      : transport(std::make_shared<LoopbackTransport>(server.api)),
        app(fieldsync::factory::BuildClient(ClientConfig(db_path), transport)) {
    app.engine->Subscribe([this](const Event& e) { events.push_back(e); });
  }

  std::size_t Count(EventKind kind) const {
    std::size_t n = 0;
    for (const auto& e : events)
      if (e.kind == kind) ++n;
    return n;
  }

  std::shared_ptr<LoopbackTransport>    transport;
  fieldsync::factory::ClientApplication app;
  std::vector<Event>                    events;
};

Blob AfterPhoto() {
  return Blob{"after.jpg", "image/jpeg", std::string("\xff\xd8\xff\xe0\0\x10JFIF", 10)};
}

void AdvanceTo(FakeServer& server, const std::string& job, JobStatus target) {
  server.lifecycle->Transition({job, target, "dispatcher", "", std::nullopt, ""});
}

void TestPhotoTakenOfflineThenJobCompleted() {
  FakeServer server;
  server.SeedJob("J");
  AdvanceTo(server, "J", JobStatus::kEnRoute);
  AdvanceTo(server, "J", JobStatus::kInProgress);

  Device device(server, TempDbPath("photo_then_complete"));
  device.app.engine->OnConnectivityLost();
  device.transport->SetOffline(true);

  const auto photo = device.app.engine->EnqueuePhoto("J", PhotoType::kAfter, AfterPhoto());
  auto       queue = device.app.engine->QueryQueueStatus();
  assert(queue.pending == 1);
  assert(queue.operations[0].id == photo);

  const auto complete =
      device.app.engine->EnqueueTransition("J", JobStatus::kCompleted, "", std::string("replaced compressor"));
  assert(device.transport->SentCount() == 0);

  device.transport->SetOffline(false);
  device.app.engine->OnConnectivityRestored();

  assert(device.app.engine->QueryQueueStatus().operations.empty());
  assert(device.Count(EventKind::kUploaded) == 2);

  // photo went first, then the completion
  const auto sent = device.transport->Sent();
  assert(sent.size() == 2);
  assert(sent[0].url == "/api/field/job/J/photos");
  assert(sent[1].method == "PUT");

  const auto snapshot = server.lifecycle->GetJob("J");
  assert(snapshot.job.status == JobStatus::kCompleted);
  assert(snapshot.job.notes == "replaced compressor");
  assert(snapshot.photos.size() == 1);
  assert(server.photos->Read(snapshot.photos[0].storage_path) == AfterPhoto().data);
  assert(snapshot.photos[0].uploaded_by == "tech-7");

  const auto audit = server.lifecycle->ListAudit("J");
  assert(audit.back().operation_id == complete);
  assert(audit.back().actor == "tech-7");
}

void TestTerminalJobRejectsReplayedTransition() {
  FakeServer server;
  server.SeedJob("K");
  AdvanceTo(server, "K", JobStatus::kEnRoute);
  AdvanceTo(server, "K", JobStatus::kInProgress);
  AdvanceTo(server, "K", JobStatus::kCompleted);
  const auto before = server.lifecycle->GetJob("K").job;

  Device     device(server, TempDbPath("terminal"));
  const auto id = device.app.engine->EnqueueTransition("K", JobStatus::kInProgress);
  device.app.engine->DrainNow();

  const auto after = server.lifecycle->GetJob("K").job;
  assert(after.status == JobStatus::kCompleted);
  assert(after.started_at_ms == before.started_at_ms);
  assert(after.completed_at_ms == before.completed_at_ms);
  assert(after.version == before.version);

  // needs attention, not retried on its own
  auto queue = device.app.engine->QueryQueueStatus();
  assert(queue.dead_letter == 1);
  assert(queue.operations[0].id == id);
  assert(queue.operations[0].failure_kind == FailureKind::kPermanent);
  assert(queue.operations[0].last_error.find("Cannot transition from COMPLETED to IN_PROGRESS") != std::string::npos);
  assert(device.Count(EventKind::kDeadLetter) == 1);
  assert(device.Count(EventKind::kUploadFailedWillRetry) == 0);

  device.app.engine->DrainNow();
  assert(device.transport->SentCount() == 1);
  assert(device.app.engine->QueryQueueStatus().dead_letter == 1);
}

void TestCancelOnlyWhilePending() {
  FakeServer server;
  server.SeedJob("L");

  Device     device(server, TempDbPath("cancel"));
  const auto first = device.app.engine->EnqueueTransition("L", JobStatus::kEnRoute);
  device.app.engine->Cancel(first);
  assert(device.app.engine->QueryQueueStatus().operations.empty());

  const auto second = device.app.engine->EnqueueTransition("L", JobStatus::kEnRoute);
  bool       rejected = false;
  device.transport->OnSend([&](const fieldsync::transport::Request&) {
    assert(device.app.engine->QueryQueueStatus().in_flight == 1);
    try {
      device.app.engine->Cancel(second);
    } catch (const fieldsync::util::InvalidState&) {
      rejected = true;
    }
  });
  device.app.engine->DrainNow();

  assert(rejected);
  assert(device.app.engine->QueryQueueStatus().operations.empty());
  assert(server.lifecycle->GetJob("L").job.status == JobStatus::kEnRoute);
}

void TestFlakyNetworkEventuallyDelivers() {
  FakeServer server;
  server.SeedJob("M");

  Device device(server, TempDbPath("flaky"));
  device.app.engine->EnqueuePhoto("M", PhotoType::kBefore, AfterPhoto());
  device.transport->FailNext(2, 502);

  device.app.engine->DrainNow();
  device.app.engine->DrainNow();
  assert(device.app.engine->QueryQueueStatus().pending == 1);
  assert(device.app.engine->QueryQueueStatus().operations[0].attempt_count == 2);

  device.app.engine->DrainNow();
  assert(device.app.engine->QueryQueueStatus().operations.empty());
  assert(device.Count(EventKind::kUploadFailedWillRetry) == 2);
  assert(device.Count(EventKind::kUploaded) == 1);
}

void TestCrashAfterServerAppliedIsDeduplicated() {
  FakeServer server;
  server.SeedJob("N");
  const auto db_path = TempDbPath("crash");

  std::string photo;
  std::string transition;
  {
    Device device(server, db_path);
    photo      = device.app.engine->EnqueuePhoto("N", PhotoType::kAfter, AfterPhoto());
    transition = device.app.engine->EnqueueTransition("N", JobStatus::kEnRoute);

    // both reach the server; the process dies before recording either outcome
    for (const auto& id : {photo, transition}) {
      const auto record = *device.app.queue->Get(id);
      device.app.queue->MarkInFlight(id);
      auto request = fieldsync::codec::ToHttpRequest(fieldsync::codec::Decode(record.payload), id);
      fieldsync::transport::SetHeader(request.headers, "X-Actor-Id", "tech-7");
      const auto response = server.api->Handle(request);
      assert(response.status / 100 == 2);
    }
  }
  assert(server.lifecycle->ListPhotos("N").size() == 1);

  Device restarted(server, db_path);
  assert(restarted.app.engine->QueryQueueStatus().in_flight == 2);

  restarted.app.engine->Start();
  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
  while (!restarted.app.engine->QueryQueueStatus().operations.empty() && std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  restarted.app.engine->Stop();

  assert(restarted.app.engine->QueryQueueStatus().operations.empty());
  assert(restarted.transport->SentCount() == 2);
  assert(server.lifecycle->ListPhotos("N").size() == 1);
  assert(server.photos->Count() == 1);
  assert(server.lifecycle->ListAudit("N").size() == 1);
  assert(server.lifecycle->GetJob("N").job.version == 1);
}

void TestFieldAppWorksFromCacheOffline() {
  FakeServer server;
  server.SeedJob("P");

  Device device(server, TempDbPath("cache"));
  device.transport->ServePage("/app/field", "<field app shell>");
  assert(device.app.engine->Precache({"/app/field"}) == 1);

  fieldsync::transport::Request job;
  job.url = "/api/field/job/P";
  assert(device.app.engine->Fetch(job).status == 200);

  device.transport->SetOffline(true);

  const auto cached = device.app.engine->Fetch(job);
  assert(cached.status == 200);
  assert(cached.body.find("\"id\":\"P\"") != std::string::npos);

  fieldsync::transport::Request route;
  route.url        = "/app/field/route?day=2026-10-18";
  route.navigation = true;
  assert(device.app.engine->Fetch(route).body == "<field app shell>");

  fieldsync::transport::Request other;
  other.url          = "/api/field/job/unknown";
  const auto offline = device.app.engine->Fetch(other);
  assert(offline.status == 503);
  assert(offline.body == "Offline - content not available");
}

} // namespace

int main() {
  TestPhotoTakenOfflineThenJobCompleted();
  TestTerminalJobRejectsReplayedTransition();
  TestCancelOnlyWhilePending();
  TestFlakyNetworkEventuallyDelivers();
  TestCrashAfterServerAppliedIsDeduplicated();
  TestFieldAppWorksFromCacheOffline();

  std::cout << "fieldsync_integration_offline_scenario: pass\n";
  return 0;
}
