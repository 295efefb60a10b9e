#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <sstream>
#include <stdexcept>

namespace fieldsync::config {

using fieldsync::runtime::config::RuntimeConfig;

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars stay strings ("1s", "0.0.0.0:7443")
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

  // detect numeric / bool
  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  char*        endptr        = nullptr;
  const double numeric_value = strtod(scalar_value.c_str(), &endptr);
  if (!scalar_value.empty() && endptr && *endptr == '\0') {
    value->set_number_value(numeric_value);
    return;
  }

  value->set_string_value(scalar_value);
}

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (size_t i = 0; i < node.size(); ++i) {
        YamlToProtoValue(node[i], list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* struct_value = value->mutable_struct_value();
      for (auto it : node) {
        YamlToProtoValue(it.second, &(*struct_value->mutable_fields())[it.first.Scalar()]);
      }
      break;
    }

    default:
      throw std::runtime_error("Unsupported YAML node");
  }
}

static RuntimeConfig ParseYamlNode(const YAML::Node& yaml) {
  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  std::string json;
  auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
  if (!to_json_status.ok()) {
    throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
  }

  RuntimeConfig config;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

  if (!status.ok()) {
    throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
  }

  ConfigLoader::ApplyDefaults(config);
  ConfigLoader::Validate(config);
  return config;
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }
  return ParseYamlNode(yaml);
}

RuntimeConfig ConfigLoader::LoadFromYamlString(const std::string& text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(text);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
  }
  return ParseYamlNode(yaml);
}

// ------------------------------------------------------------
// Defaults
// ------------------------------------------------------------

void ConfigLoader::ApplyDefaults(RuntimeConfig& config) {
  auto* logging = config.mutable_logging();
  if (!logging->file_path().empty()) {
    if (logging->max_file_bytes() == 0) logging->set_max_file_bytes(5ull * 1024 * 1024);
    if (logging->max_files() == 0) logging->set_max_files(3);
  }

  auto* cache = config.mutable_cache();
  if (cache->version().empty()) cache->set_version("v1");
  if (cache->bucket_prefix().empty()) cache->set_bucket_prefix("fieldsync");
  if (cache->api_prefixes().empty()) cache->add_api_prefixes("/api/field/");
  if (cache->page_prefixes().empty()) cache->add_page_prefixes("/app/field");
  if (cache->static_prefixes().empty()) {
    for (const char* prefix : {"/images/", "/fonts/", "/_next/static/"}) cache->add_static_prefixes(prefix);
  }
  if (cache->static_extensions().empty()) {
    for (const char* ext : {".png", ".jpg", ".jpeg", ".webp", ".svg", ".ico", ".woff", ".woff2", ".ttf", ".css", ".js"}) {
      cache->add_static_extensions(ext);
    }
  }
  if (cache->offline_fallback_url().empty()) cache->set_offline_fallback_url("/app/field");
  if (cache->precache_urls().empty()) {
    for (const char* url : {"/app/field", "/app/field/route", "/app/field/shift", "/app/field/history"}) {
      cache->add_precache_urls(url);
    }
  }
  if (cache->network_timeout_ms() == 0) cache->set_network_timeout_ms(10000);

  auto* replay = config.mutable_replay();
  if (replay->max_attempts() == 0) replay->set_max_attempts(3);
  if (replay->attempt_timeout_ms() == 0) replay->set_attempt_timeout_ms(30000);

  auto* server = config.mutable_server();
  if (server->bind_address().empty()) server->set_bind_address("0.0.0.0:7443");
  if (server->photo_dir().empty()) server->set_photo_dir("photos");
  if (server->max_photo_bytes() == 0) server->set_max_photo_bytes(10ull * 1024 * 1024);
  if (server->allowed_content_types().empty()) {
    for (const char* type : {"image/jpeg", "image/png", "image/webp"}) server->add_allowed_content_types(type);
  }

  auto* client = config.mutable_client();
  if (client->server_address().empty()) client->set_server_address("127.0.0.1:7443");
}

void ConfigLoader::Validate(const RuntimeConfig& config) {
  if (config.database().has_sqlite() && config.database().sqlite().path().empty()) {
    throw std::runtime_error("Invalid configuration: database.sqlite.path must not be empty");
  }
  if (config.replay().max_attempts() < 1) {
    throw std::runtime_error("Invalid configuration: replay.max_attempts must be at least 1");
  }
  if (config.cache().offline_fallback_url().empty() || config.cache().offline_fallback_url().front() != '/') {
    throw std::runtime_error("Invalid configuration: cache.offline_fallback_url must be an absolute path");
  }
}

} // namespace fieldsync::config
