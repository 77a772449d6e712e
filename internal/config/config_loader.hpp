#pragma once

#include <string>

#include "config/config.pb.h"

namespace taskengine::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf; unknown keys and a
  selected database backend without its location are rejected with
  std::runtime_error.
*/
class ConfigLoader {
 public:
  static taskengine::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
};

} // namespace taskengine::config
