#pragma once

#include <string>

#include "config/config.pb.h"

namespace timebank::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Unknown keys are
  rejected. Fields left unset receive engine defaults.
*/
class ConfigLoader {
 public:
  static timebank::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static timebank::runtime::config::RuntimeConfig LoadFromString(const std::string& yaml);

  static void ApplyDefaults(timebank::runtime::config::RuntimeConfig& config);
  static void Validate(const timebank::runtime::config::RuntimeConfig& config);
};

} // namespace timebank::config
