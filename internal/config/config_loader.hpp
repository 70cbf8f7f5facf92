#pragma once

#include <string>

#include "config/config.pb.h"

namespace turnstile::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf, so the proto schema
  is the single source of truth for field names and unknown keys are
  rejected.
*/
class ConfigLoader {
 public:
  static turnstile::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  static turnstile::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml_text);
};

} // namespace turnstile::config
