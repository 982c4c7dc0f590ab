#pragma once

#include <string>
#include <vector>

#include "internal/model/exposure_key.hpp"

namespace keyserver::model {

/*
  A publish request as seen by the pipeline.

  Populated once from the wire schema (see publish_mapping.hpp) and only ever
  passed by const reference afterwards.
*/
struct Publish {
  std::vector<ExposureKey> keys;
  std::vector<std::string> regions;

  // Android package name or iOS bundle id.
  std::string app_package_name;
  std::string platform;

  std::string device_verification_payload;
  std::string verification_payload;
  std::string padding;
};

} // namespace keyserver::model
