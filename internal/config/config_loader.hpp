#pragma once

#include <string>

#include "config/config.pb.h"

namespace relay::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf.
*/
class ConfigLoader {
 public:
  static relay::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  // Same conversion for an in-memory document; used by tests and embedders.
  static relay::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);
};

} // namespace relay::config
