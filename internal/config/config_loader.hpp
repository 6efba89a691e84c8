#pragma once

#include <cstdint>
#include <string>

#include "config/config.pb.h"

namespace replication::config {

inline constexpr const char*   kDefaultMetadataTable = "metadata";
inline constexpr const char*   kDefaultWorkQueueRoot = "/replication/workqueue";
inline constexpr std::uint32_t kDefaultRetryMs       = 1000;

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf; unknown keys are
  rejected. Missing values are filled with defaults and the result is
  validated before it is returned.
*/
class ConfigLoader {
 public:
  static replication::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static replication::runtime::config::RuntimeConfig LoadFromString(const std::string& yaml_text);

  static void ApplyDefaults(replication::runtime::config::RuntimeConfig* config);
  static void Validate(const replication::runtime::config::RuntimeConfig& config);
};

} // namespace replication::config
