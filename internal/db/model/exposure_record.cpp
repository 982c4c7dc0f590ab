#include "internal/db/model/exposure_record.hpp"

#include <algorithm>
#include <stdexcept>

#include "internal/util/time.hpp"

namespace keyserver::db::model {

ExposureRecord ToRecord(const keyserver::model::Exposure& exposure) {
  ExposureRecord record;
  record.exposure_key.assign(exposure.exposure_key.begin(), exposure.exposure_key.end());
  record.transmission_risk = exposure.transmission_risk;
  record.app_package_name  = exposure.app_package_name;
  record.regions           = exposure.regions;
  record.interval_number   = exposure.interval_number;
  record.interval_count    = exposure.interval_count;
  record.created_at_ms     = util::ToUnixMillis(exposure.created_at);
  record.local_provenance  = exposure.local_provenance;
  record.sync_id           = exposure.federation_sync_id;
  return record;
}

keyserver::model::Exposure FromRecord(const ExposureRecord& record) {
  if (record.exposure_key.size() != keyserver::model::kKeyLength) {
    throw std::runtime_error("stored exposure key has length " + std::to_string(record.exposure_key.size()));
  }

  keyserver::model::Exposure exposure;
  std::transform(record.exposure_key.begin(), record.exposure_key.end(), exposure.exposure_key.begin(),
                 [](char c) { return static_cast<std::uint8_t>(c); });
  exposure.transmission_risk  = record.transmission_risk;
  exposure.app_package_name   = record.app_package_name;
  exposure.regions            = record.regions;
  exposure.interval_number    = record.interval_number;
  exposure.interval_count     = record.interval_count;
  exposure.created_at         = util::FromUnixMillis(record.created_at_ms);
  exposure.local_provenance   = record.local_provenance;
  exposure.federation_sync_id = record.sync_id;
  return exposure;
}

bool MatchesQuery(const ExposureRecord& record, const ExposureQuery& query) {
  if (query.created_after_ms && record.created_at_ms < *query.created_after_ms) {
    return false;
  }
  if (query.created_before_ms && record.created_at_ms >= *query.created_before_ms) {
    return false;
  }
  if (query.only_local_provenance && !record.local_provenance) {
    return false;
  }
  if (query.region && std::find(record.regions.begin(), record.regions.end(), *query.region) == record.regions.end()) {
    return false;
  }
  return true;
}

} // namespace keyserver::db::model
