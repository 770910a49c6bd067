#pragma once

#include <string>

#include "config/config.pb.h"

namespace stepdb::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf, so unknown keys
  are rejected the same way a malformed JSON config would be.
*/
class ConfigLoader {
 public:
  static stepdb::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  static stepdb::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);
};

} // namespace stepdb::config
