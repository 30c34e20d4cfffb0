#pragma once

#include <string>

#include "config/config.pb.h"

namespace fetchgate::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf. Unknown keys are
  rejected.
*/
class ConfigLoader {
 public:
  static fetchgate::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static fetchgate::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);
};

} // namespace fetchgate::config
