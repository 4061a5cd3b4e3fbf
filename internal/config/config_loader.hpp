#pragma once

#include <string>

#include "config/config.pb.h"

namespace rtask::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf.
*/
class ConfigLoader {
 public:
  static rtask::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  static rtask::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);
};

} // namespace rtask::config
