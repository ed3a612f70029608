#pragma once

#include <string>

#include "config/config.pb.h"

namespace settlement::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Unknown keys are
  rejected. After parsing, environment overrides and defaults are applied
  and the result is validated.

  Environment:
      SETTLEMENT_WEBHOOK_SECRET   replaces intake.webhook_secret
*/
class ConfigLoader {
 public:
  static settlement::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static settlement::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);

  static void ApplyDefaults(settlement::runtime::config::RuntimeConfig& config);
  // Throws std::runtime_error naming the first invalid field.
  static void Validate(const settlement::runtime::config::RuntimeConfig& config);
};

} // namespace settlement::config
