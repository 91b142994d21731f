#pragma once

#include <string>

#include "config/config.pb.h"

namespace notify::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf, so unknown keys
  and type mismatches are rejected by the protobuf JSON parser. Zero
  values mean "use the default" and are resolved by the consumers.
*/
class ConfigLoader {
 public:
  static notify::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static notify::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);

 private:
  static void Validate(const notify::runtime::config::RuntimeConfig& config);
};

} // namespace notify::config
