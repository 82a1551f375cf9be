#pragma once

#include <string>

#include "config/config.pb.h"

namespace narrative::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf, so unknown keys
  and mistyped values are rejected by the protobuf JSON parser. The
  result is checked by Validate() before it is returned.
*/
class ConfigLoader {
 public:
  static narrative::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static narrative::runtime::config::RuntimeConfig LoadFromString(const std::string& yaml_text);

  // Throws std::runtime_error naming the first inconsistent setting.
  static void Validate(const narrative::runtime::config::RuntimeConfig& config);
};

} // namespace narrative::config
