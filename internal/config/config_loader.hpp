#pragma once

#include <string>

#include "config/config.pb.h"

namespace jobstore::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to a protobuf Value, serialized to JSON and parsed into
  RuntimeConfig. Unknown keys are rejected. Quoted scalars stay strings.
*/
class ConfigLoader {
 public:
  static jobstore::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  static jobstore::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);
};

} // namespace jobstore::config
