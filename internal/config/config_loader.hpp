#pragma once

#include <string>

#include "config/config.pb.h"

namespace tempo::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf, so unknown keys are
  rejected. Quoted scalars always stay strings.
*/
class ConfigLoader {
 public:
  static tempo::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  static tempo::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);
};

} // namespace tempo::config
