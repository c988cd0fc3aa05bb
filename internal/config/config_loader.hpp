#pragma once

#include <string>

#include "castproxy/config/config.pb.h"

namespace castproxy::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Defaults are
  filled in for unset fields and the result is validated.
*/
class ConfigLoader {
 public:
  static castproxy::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  static castproxy::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);

  static void ApplyDefaults(castproxy::runtime::config::RuntimeConfig& config);

  // Throws util::InvalidConfig.
  static void Validate(const castproxy::runtime::config::RuntimeConfig& config);
};

} // namespace castproxy::config
