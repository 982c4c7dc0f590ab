#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "internal/model/exposure_key.hpp"
#include "internal/util/time.hpp"

namespace keyserver::model {

using KeyBytes = std::array<std::uint8_t, kKeyLength>;

/*
  Validated exposure, ready to be stored.

  Only produced by publish::TransformExposureKey. A record either exists in
  full or not at all.
*/
struct Exposure {
  KeyBytes     exposure_key{};
  int          transmission_risk = 0;
  std::string  app_package_name;
  std::vector<std::string> regions;
  std::int32_t interval_number = 0;
  std::int32_t interval_count  = 0;
  util::TimePoint created_at{};

  // false is reserved for records received through federation.
  bool local_provenance = true;
  std::optional<std::int64_t> federation_sync_id;
};

} // namespace keyserver::model
