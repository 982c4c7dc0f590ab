#pragma once

#include <string>

#include "config/config.pb.h"

namespace keyserver::config {

/*
  Reads RuntimeConfig from YAML.

  The document goes YAML -> google.protobuf.Value -> JSON -> RuntimeConfig,
  so keys are the proto field names and durations use the protobuf JSON
  form ("3600s"). Unknown keys are an error. Every failure throws
  util::InvalidConfig.
*/
class ConfigLoader {
 public:
  static keyserver::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  static keyserver::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);
};

} // namespace keyserver::config
