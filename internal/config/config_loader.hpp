#pragma once

#include <string>

#include "config/config.pb.h"

namespace goalgraph::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf; unknown keys are
  rejected.
*/
class ConfigLoader {
 public:
  static goalgraph::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static goalgraph::runtime::config::RuntimeConfig LoadFromString(const std::string& yaml_text);
};

} // namespace goalgraph::config
