#pragma once

#include <string>

#include "config/config.pb.h"

namespace bridgewatch::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Unknown keys are
  rejected. After parsing, defaults are filled in for zero-valued fields,
  environment overrides are applied and the result is validated.
*/
class ConfigLoader {
 public:
  static bridgewatch::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  static void ApplyDefaults(bridgewatch::runtime::config::RuntimeConfig& config);
  static void ApplyEnvironment(bridgewatch::runtime::config::RuntimeConfig& config);

  // throws std::invalid_argument describing the first violation
  static void Validate(const bridgewatch::runtime::config::RuntimeConfig& config);
};

} // namespace bridgewatch::config
