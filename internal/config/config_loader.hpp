#pragma once

#include <string>

#include "config/config.pb.h"

namespace hacktracker::config {

constexpr int     kDefaultCacheSchemaVersion = 2;
constexpr int64_t kDefaultCacheTtlSeconds    = 24 * 60 * 60;
constexpr int64_t kDefaultKeepAliveSeconds   = 5 * 60;

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Missing sections get
  defaults, then the result is validated; an invalid file throws
  std::runtime_error.
*/
class ConfigLoader {
 public:
  static hacktracker::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  // Config with every default applied (memory storage).
  static hacktracker::runtime::config::RuntimeConfig Defaults();

  static void ApplyDefaults(hacktracker::runtime::config::RuntimeConfig* config);
  static void Validate(const hacktracker::runtime::config::RuntimeConfig& config);
};

} // namespace hacktracker::config
