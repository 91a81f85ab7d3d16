#pragma once

#include <string>

#include "config/config.pb.h"

namespace mirrorwatch::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Defaults are filled in
  for unset values and the result is validated; every failure is raised as
  util::ConfigurationError.
*/
class ConfigLoader {
 public:
  static mirrorwatch::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  // Same pipeline for an in-memory document.
  static mirrorwatch::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& document);

  static void ApplyDefaults(mirrorwatch::runtime::config::RuntimeConfig& config);

  static void Validate(const mirrorwatch::runtime::config::RuntimeConfig& config);
};

} // namespace mirrorwatch::config
