#pragma once

#include <string>

#include "config/config.pb.h"

namespace fieldsync::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Unknown keys are
  rejected; missing keys receive the defaults below.
*/
class ConfigLoader {
 public:
  static fieldsync::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static fieldsync::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);

  // Fills unset fields. Safe to call repeatedly.
  static void ApplyDefaults(fieldsync::runtime::config::RuntimeConfig& config);

  // Throws std::runtime_error on values the engine cannot run with.
  static void Validate(const fieldsync::runtime::config::RuntimeConfig& config);
};

} // namespace fieldsync::config
