#pragma once

#include <string>

#include "config/config.pb.h"

namespace practicedb::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf, so the
  generated message is the single schema for every option.
*/
class ConfigLoader {
 public:
  static practicedb::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static practicedb::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);

  // Fills unset numeric options with their documented defaults.
  static void ApplyDefaults(practicedb::runtime::config::RuntimeConfig& config);
};

} // namespace practicedb::config
