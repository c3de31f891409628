#pragma once

#include <string>

#include "config/config.pb.h"

namespace chadoxml::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf; unknown keys are
  rejected. Unset fields are filled with defaults afterwards, so callers
  never see COMPRESSION_POLICY_UNSPECIFIED or PAYLOAD_CODEC_UNSPECIFIED.
*/
class ConfigLoader {
 public:
  static chadoxml::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static chadoxml::runtime::config::RuntimeConfig LoadFromString(const std::string& yaml);

  // Path from CHADOXML_CONFIG, or defaults when unset.
  static chadoxml::runtime::config::RuntimeConfig LoadFromEnvironment();

  static chadoxml::runtime::config::RuntimeConfig Defaults();
  static void ApplyDefaults(chadoxml::runtime::config::RuntimeConfig& config);
};

} // namespace chadoxml::config
