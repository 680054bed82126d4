#pragma once

#include <string>

#include "config/config.pb.h"

namespace longform::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf; unknown fields are
  rejected. Unset tunables are filled with defaults afterwards.
*/
class ConfigLoader {
 public:
  static longform::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static longform::runtime::config::RuntimeConfig LoadFromString(const std::string& yaml_text);

  static void ApplyDefaults(longform::runtime::config::RuntimeConfig* config);
};

} // namespace longform::config
