#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/types.hpp"
#include "internal/model/exposure.hpp"

namespace keyserver::db::model {

/*
  Persistent exposure row.

  IMPORTANT:
  - exposure_key holds the 16 raw key bytes and is the primary key.
  - regions are upper case.
  - sync_id is only set for rows received through federation.
*/

struct ExposureRecord {
  std::string exposure_key;

  int                      transmission_risk = 0;
  std::string              app_package_name;
  std::vector<std::string> regions;

  std::int32_t interval_number = 0;
  std::int32_t interval_count  = 0;

  std::int64_t created_at_ms = 0;

  bool                        local_provenance = true;
  std::optional<std::int64_t> sync_id;
};

ExposureRecord ToRecord(const keyserver::model::Exposure& exposure);

// Throws std::runtime_error if the stored key is not 16 bytes.
keyserver::model::Exposure FromRecord(const ExposureRecord& record);

bool MatchesQuery(const ExposureRecord& record, const ExposureQuery& query);

} // namespace keyserver::db::model
