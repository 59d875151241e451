#pragma once

#include <string>

#include "config/config.pb.h"

namespace pageforge::config {

/*
  Loads RuntimeConfig from a YAML file.

  YAML is converted to JSON then parsed into protobuf. Unset values are filled
  with defaults and the result is range-checked before it is returned.
*/
class ConfigLoader {
 public:
  static pageforge::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  static pageforge::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);

  static void ApplyDefaults(pageforge::runtime::config::RuntimeConfig& config);

  // throws pageforge::util::ValidationFailure
  static void Validate(const pageforge::runtime::config::RuntimeConfig& config);
};

} // namespace pageforge::config
