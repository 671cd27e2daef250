#pragma once

#include <string>

#include "config/config.pb.h"

namespace weave::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf.
  Durations are protobuf JSON strings ("250ms" is not valid, use "0.25s").
*/
class ConfigLoader {
 public:
  static weave::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static weave::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);

  // Fills unset fields with engine defaults.
  static void ApplyDefaults(weave::runtime::config::RuntimeConfig& config);
};

} // namespace weave::config
