#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

#include "internal/model/exposure.hpp"
#include "internal/model/exposure_key.hpp"
#include "internal/model/publish.hpp"
#include "internal/util/time.hpp"

namespace keyserver::publish {

// Upper bound for TransformerConfig::max_interval_start_age.
constexpr std::chrono::hours kMaxIntervalStartAgeLimit{24 * 365};

/*
  Per-deployment publish policy.

  Fixed for the lifetime of a Transformer. To change it, build a new
  Transformer.
*/
struct TransformerConfig {
  // 1..model::kMaxKeysPerPublish
  int max_exposure_keys = model::kMaxKeysPerPublish;

  // Oldest accepted key start, relative to the batch time. 0..kMaxIntervalStartAgeLimit
  std::chrono::seconds max_interval_start_age = std::chrono::hours(24 * 15);

  // created_at granularity.
  std::chrono::seconds truncate_window = std::chrono::hours(1);

  // Accept keys that are still valid at batch time. Never in production.
  bool skip_key_still_valid_check = false;
};

/*
  Validates one key and converts it to an Exposure.

  Checks, in order: base64 encoding, 16 byte length, interval count range,
  interval_number >= min_interval_number, interval_number < max_interval_number,
  key window ended by max_interval_number (unless skip_key_still_valid),
  transmission risk range.

  Throws PublishError with the first failing check.
*/
model::Exposure TransformExposureKey(const model::ExposureKey& key, const std::string& app_package_name,
                                     const std::vector<std::string>& upcased_regions, util::TimePoint created_at,
                                     std::int32_t min_interval_number, std::int32_t max_interval_number,
                                     bool skip_key_still_valid = false);

/*
  Rejects keys whose windows overlap without sharing a start interval.

  Keys with the same start interval are allowed (a key replaced part way
  through the day). Scans a sorted copy; exposures is not reordered.
  Throws PublishError(kMisalignedOverlap).
*/
void ValidateAlignedOverlap(const std::vector<model::Exposure>& exposures);

/*
  Publish -> Exposure[] transformer.

  Stateless apart from its config, safe to share between threads.
*/
class Transformer {
 public:
  // Throws util::InvalidConfig.
  explicit Transformer(TransformerConfig config);

  /*
    Validates the whole batch against batch_time.

    All or nothing: any invalid key fails the batch with
    kInvalidPublishData wrapping the cause, and nothing is returned.
    The result keeps the order of publish.keys. A non-ASCII region
    throws util::InvalidArgument before any key is looked at.
  */
  std::vector<model::Exposure> TransformPublish(const model::Publish& publish, util::TimePoint batch_time) const;

  const TransformerConfig& config() const {
    return config_;
  }

 private:
  const TransformerConfig config_;
};

} // namespace keyserver::publish
