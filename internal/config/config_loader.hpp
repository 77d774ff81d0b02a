#pragma once

#include <string>

#include "config/config.pb.h"

namespace txcluster::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf. Unknown keys are
  rejected. Failures raise util::ConfigurationError.
*/
class ConfigLoader {
 public:
  static txcluster::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static txcluster::runtime::config::RuntimeConfig LoadFromString(const std::string& yaml_text);
};

} // namespace txcluster::config
