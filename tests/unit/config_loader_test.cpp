#include "config/config.pb.h"
#include "internal/config/config_loader.hpp"
#include "internal/observability/logging.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <stdexcept>
#include <string>

namespace {

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "fieldsync_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void TestScalarEscapingForQuotedAndBackslashValues() {
  const auto yaml_path = WriteYaml("quoted_backslash",
                                   R"(server:
  bind_address: "0.0.0.0:7443"
database:
  sqlite:
    path: "C:\\fieldsync\\\"quoted\"\\db.sqlite"
    wal_mode: true
)");

  auto config = fieldsync::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.database().sqlite().path() == "C:\\fieldsync\\\"quoted\"\\db.sqlite");
  assert(config.database().sqlite().has_wal_mode());
  assert(config.database().sqlite().wal_mode());
}

void TestQuotedNumbersStayStrings() {
  auto config = fieldsync::config::ConfigLoader::LoadFromYamlString(R"(cache:
  version: "2"
client:
  actor_id: "1001"
)");
  assert(config.cache().version() == "2");
  assert(config.client().actor_id() == "1001");
}

void TestDefaultsAreApplied() {
  auto config = fieldsync::config::ConfigLoader::LoadFromYamlString(R"(database:
  memory: {}
)");

  assert(config.database().has_memory());
  assert(config.cache().version() == "v1");
  assert(config.cache().bucket_prefix() == "fieldsync");
  assert(config.cache().offline_fallback_url() == "/app/field");
  assert(config.cache().precache_urls_size() == 4);
  assert(config.cache().precache_urls(0) == "/app/field");
  assert(config.cache().api_prefixes(0) == "/api/field/");
  assert(config.replay().max_attempts() == 3);
  assert(config.replay().attempt_timeout_ms() == 30000);
  assert(config.replay().poll_interval_ms() == 0);
  assert(config.server().max_photo_bytes() == 10ull * 1024 * 1024);
  assert(config.server().allowed_content_types_size() == 3);
}

void TestExplicitValuesWin() {
  auto config = fieldsync::config::ConfigLoader::LoadFromYamlString(R"(cache:
  version: v7
  precache_urls: ["/app/field"]
replay:
  max_attempts: 5
  poll_interval_ms: 250
)");

  assert(config.cache().version() == "v7");
  assert(config.cache().precache_urls_size() == 1);
  assert(config.replay().max_attempts() == 5);
  assert(config.replay().poll_interval_ms() == 250);
}

void TestUnknownFieldsAreRejected() {
  const auto yaml_path = WriteYaml("unknown_field",
                                   R"(server:
  bind_address: "0.0.0.0:7443"
unknown_field: 123
)");

  bool threw = false;
  try {
    (void)fieldsync::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const std::runtime_error&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestEmptySqlitePathIsRejected() {
  bool threw = false;
  try {
    (void)fieldsync::config::ConfigLoader::LoadFromYamlString(R"(database:
  sqlite:
    path: ""
)");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

void TestRelativeFallbackUrlIsRejected() {
  bool threw = false;
  try {
    (void)fieldsync::config::ConfigLoader::LoadFromYamlString(R"(cache:
  offline_fallback_url: "app/field"
)");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

void TestMissingFileIsReported() {
  bool threw = false;
  try {
    (void)fieldsync::config::ConfigLoader::LoadFromYaml("/nonexistent/fieldsync.yaml");
  } catch (const std::runtime_error& e) {
    threw = std::string(e.what()).find("Failed to load YAML config") != std::string::npos;
  }
  assert(threw);
}

void TestLogFileDefaults() {
  auto config = fieldsync::config::ConfigLoader::LoadFromYamlString(R"(logging:
  level: debug
  file_path: /var/log/fieldsync/device.log
)");
  assert(config.logging().max_file_bytes() == 5ull * 1024 * 1024);
  assert(config.logging().max_files() == 3);

  auto quiet = fieldsync::config::ConfigLoader::LoadFromYamlString("logging:\n  level: warn\n");
  assert(quiet.logging().max_files() == 0);
}

void TestLoggingWritesTheConfiguredFile() {
  const auto dir = std::filesystem::temp_directory_path() / "fieldsync_config_loader_tests";
  std::filesystem::create_directories(dir);
  const auto log_path = dir / "device.log";
  std::filesystem::remove(log_path);

  fieldsync::runtime::config::RuntimeConfig config;
  config.mutable_logging()->set_level("info");
  config.mutable_logging()->set_file_path(log_path.string());
  fieldsync::config::ConfigLoader::ApplyDefaults(config);

  fieldsync::observability::InitializeLogging(config);
  FIELDSYNC_LOG_DEBUG("below threshold");
  FIELDSYNC_LOG_INFO("operation queued", {fieldsync::observability::StringField("endpoint", "PUT /api/field/job/7"),
                                          fieldsync::observability::IntField("sequence", 12)});
  fieldsync::observability::ShutdownLogging();

  std::ifstream in(log_path);
  const std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  assert(text.find("operation queued endpoint=\"PUT /api/field/job/7\" sequence=12") != std::string::npos);
  assert(text.find("below threshold") == std::string::npos);
}

void TestFieldFormatting() {
  using fieldsync::observability::FormatFields;
  using fieldsync::observability::StringField;

  assert(FormatFields({}).empty());
  assert(FormatFields({StringField("job_id", "42"), fieldsync::observability::BoolField("ok", true)}) == "job_id=42 ok=true");
  assert(FormatFields({StringField("error", "")}) == "error=\"\"");
  assert(FormatFields({StringField("body", "say \"hi\"\n")}) == "body=\"say \\\"hi\\\"\\n\"");
}

} // namespace

int main() {
  TestScalarEscapingForQuotedAndBackslashValues();
  TestQuotedNumbersStayStrings();
  TestDefaultsAreApplied();
  TestExplicitValuesWin();
  TestUnknownFieldsAreRejected();
  TestEmptySqlitePathIsRejected();
  TestRelativeFallbackUrlIsRejected();
  TestMissingFileIsReported();
  TestLogFileDefaults();
  TestLoggingWritesTheConfiguredFile();
  TestFieldFormatting();

  std::cout << "fieldsync_unit_config_loader: pass\n";
  return 0;
}
