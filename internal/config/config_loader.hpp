#pragma once

#include <string>

#include "config/config.pb.h"

namespace colguard::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf.
  Unset fields are filled with defaults afterwards.
*/
class ConfigLoader {
 public:
  static RuntimeConfig LoadFromYaml(const std::string& path);

  // All defaults, no file.
  static RuntimeConfig Default();

  static void ApplyDefaults(RuntimeConfig& config);
};

constexpr unsigned kDefaultMacroDepthLimit = 32;

constexpr unsigned kDefaultCacheValidityMinutes = 1440;

} // namespace colguard::config
