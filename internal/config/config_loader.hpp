#pragma once

#include <string>

#include "config/config.pb.h"

namespace asyncquery::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf. Quoted YAML scalars
  stay strings; plain scalars are typed (bool, number, string).
*/
class ConfigLoader {
 public:
  static asyncquery::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static asyncquery::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);
};

} // namespace asyncquery::config
