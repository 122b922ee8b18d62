#pragma once

#include <string>

#include "config/config.pb.h"

namespace localdeck::config {

/*
  Loads RuntimeConfig from YAML.

  YAML is converted to JSON then parsed into protobuf; unknown keys are
  rejected. Quoted scalars always stay strings, so a card id or video id
  that happens to look numeric survives the round trip.
*/
class ConfigLoader {
 public:
  static localdeck::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);
  static localdeck::runtime::config::RuntimeConfig LoadFromString(const std::string& yaml_text);
};

} // namespace localdeck::config
