#pragma once

#include <string>

#include "config/config.pb.h"

namespace archive::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf, so the proto schema
  is the single definition of what a config file may contain. Defaults are
  applied after parsing and the result is validated; any problem throws
  std::runtime_error.
*/
class ConfigLoader {
 public:
  static archive::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static archive::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml_text);

  static constexpr const char* kDefaultBindAddress = "0.0.0.0:50061";
};

} // namespace archive::config
