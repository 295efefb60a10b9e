#include "internal/observability/logging.hpp"

#include <cstdlib>
#include <string>
#include <vector>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config/config.pb.h"

namespace fieldsync::observability {
namespace {

constexpr const char* kLoggerName     = "fieldsync";
constexpr const char* kDefaultPattern = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] [%t] %v";

// Environment beats the config file so a technician's device can be
// switched to debug without touching the deployed yaml.
std::string FromEnvOr(const char* name, const std::string& configured, const std::string& fallback) {
  if (const char* value = std::getenv(name); value != nullptr && *value != '\0') return value;
  return configured.empty() ? fallback : configured;
}

spdlog::level::level_enum ParseLevel(const std::string& name) {
  const auto level = spdlog::level::from_str(name);
  // from_str answers "off" for anything it does not know
  if (level == spdlog::level::off && name != "off") return spdlog::level::info;
  return level;
}

bool NeedsQuoting(const std::string& value) {
  if (value.empty()) return true;
  for (const char c : value) {
    if (c == ' ' || c == '"' || c == '=' || c == '\n' || c == '\t') return true;
  }
  return false;
}

void AppendValue(std::string& out, const std::string& value) {
  if (!NeedsQuoting(value)) {
    out += value;
    return;
  }
  out += '"';
  for (const char c : value) {
    switch (c) {
      case '"':
        out += "\\\"";
        break;
      case '\n':
        out += "\\n";
        break;
      case '\t':
        out += "\\t";
        break;
      default:
        out += c;
    }
  }
  out += '"';
}

} // namespace

LogField StringField(std::string_view key, std::string_view value) {
  return {std::string(key), std::string(value)};
}

LogField IntField(std::string_view key, std::int64_t value) {
  return {std::string(key), std::to_string(value)};
}

LogField BoolField(std::string_view key, bool value) {
  return {std::string(key), value ? "true" : "false"};
}

std::string FormatFields(std::initializer_list<LogField> fields) {
  std::string out;
  for (const auto& field : fields) {
    if (!out.empty()) out += ' ';
    out += field.key;
    out += '=';
    AppendValue(out, field.value);
  }
  return out;
}

void InitializeLogging(const fieldsync::runtime::config::RuntimeConfig& config) {
  const auto& logging = config.logging();

  // stdout belongs to fieldsyncctl's JSON output
  std::vector<spdlog::sink_ptr> sinks;
  sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());

  const auto file_path = FromEnvOr("FIELDSYNC_LOG_FILE", logging.file_path(), "");
  if (!file_path.empty()) {
    const auto max_bytes = logging.max_file_bytes() > 0 ? logging.max_file_bytes() : 5ull * 1024 * 1024;
    const auto max_files = logging.max_files() > 0 ? logging.max_files() : 3u;
    sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(file_path, max_bytes, max_files));
  }

  spdlog::drop(kLoggerName);
  auto logger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
  logger->set_pattern(FromEnvOr("FIELDSYNC_LOG_PATTERN", logging.pattern(), kDefaultPattern));
  logger->set_level(ParseLevel(FromEnvOr("FIELDSYNC_LOG_LEVEL", logging.level(), "info")));
  logger->flush_on(spdlog::level::warn);
  spdlog::set_default_logger(std::move(logger));
}

void ShutdownLogging() {
  if (auto logger = spdlog::get(kLoggerName)) logger->flush();
  spdlog::shutdown();
}

void Log(spdlog::level::level_enum level, std::string_view message, std::initializer_list<LogField> fields) {
  // no default logger once ShutdownLogging has run
  auto* logger = spdlog::default_logger_raw();
  if (logger == nullptr || !logger->should_log(level)) return;

  const auto formatted = FormatFields(fields);
  if (formatted.empty()) {
    logger->log(level, "{}", message);
  } else {
    logger->log(level, "{} {}", message, formatted);
  }
}

} // namespace fieldsync::observability
