#pragma once

#include <string>

#include "config/config.pb.h"

namespace labbook::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Unknown fields and
  missing stage roots are rejected with std::runtime_error.
*/
class ConfigLoader {
 public:
  static labbook::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  static void Validate(const labbook::runtime::config::RuntimeConfig& config);
};

} // namespace labbook::config
