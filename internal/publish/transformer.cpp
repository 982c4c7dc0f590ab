#include "internal/publish/transformer.hpp"

#include <algorithm>
#include <utility>

#include "internal/model/interval.hpp"
#include "internal/model/region.hpp"
#include "internal/publish/publish_error.hpp"
#include "internal/util/base64.hpp"
#include "internal/util/errors.hpp"

namespace keyserver::publish {

namespace {

TransformerConfig Validated(TransformerConfig config) {
  if (config.max_exposure_keys < 1 || config.max_exposure_keys > model::kMaxKeysPerPublish) {
    throw util::InvalidConfig("max_exposure_keys must be >= 1 and <= " + std::to_string(model::kMaxKeysPerPublish) + ", got " +
                              std::to_string(config.max_exposure_keys));
  }
  if (config.max_interval_start_age < std::chrono::seconds::zero()) {
    throw util::InvalidConfig("max_interval_start_age must not be negative");
  }
  if (config.max_interval_start_age > kMaxIntervalStartAgeLimit) {
    throw util::InvalidConfig("max_interval_start_age must be <= " +
                              std::to_string(std::chrono::duration_cast<std::chrono::seconds>(kMaxIntervalStartAgeLimit).count()) +
                              "s, got " + std::to_string(config.max_interval_start_age.count()) + "s");
  }
  if (config.truncate_window < std::chrono::seconds::zero()) {
    throw util::InvalidConfig("truncate_window must not be negative");
  }
  return config;
}

} // namespace

model::Exposure TransformExposureKey(const model::ExposureKey& key, const std::string& app_package_name,
                                     const std::vector<std::string>& upcased_regions, util::TimePoint created_at,
                                     std::int32_t min_interval_number, std::int32_t max_interval_number,
                                     bool skip_key_still_valid) {
  constexpr auto kExpectedLength = static_cast<std::int64_t>(model::kKeyLength);

  const auto decoded = util::Base64Decode(key.key);
  if (!decoded) {
    throw PublishError(PublishErrorKind::kInvalidKeyEncoding, "exposure key is not valid base64");
  }

  if (decoded->size() != model::kKeyLength) {
    throw PublishError(PublishErrorKind::kInvalidKeyLength,
                       "invalid key length, " + std::to_string(decoded->size()) + ", must be " + std::to_string(model::kKeyLength),
                       {static_cast<std::int64_t>(decoded->size()), kExpectedLength, kExpectedLength});
  }

  const auto count = key.interval_count;
  if (count < model::kMinIntervalCount || count > model::kMaxIntervalCount) {
    throw PublishError(PublishErrorKind::kInvalidIntervalCount,
                       "invalid interval count, " + std::to_string(count) + ", must be >= " + std::to_string(model::kMinIntervalCount) +
                           " && <= " + std::to_string(model::kMaxIntervalCount),
                       {count, model::kMinIntervalCount, model::kMaxIntervalCount});
  }

  if (key.interval_number < min_interval_number) {
    throw PublishError(PublishErrorKind::kIntervalTooOld,
                       "interval number " + std::to_string(key.interval_number) + " is too old, must be >= " +
                           std::to_string(min_interval_number),
                       {key.interval_number, min_interval_number, std::nullopt});
  }
  if (key.interval_number >= max_interval_number) {
    throw PublishError(PublishErrorKind::kIntervalInFuture,
                       "interval number " + std::to_string(key.interval_number) + " is in the future, must be < " +
                           std::to_string(max_interval_number),
                       {key.interval_number, std::nullopt, max_interval_number});
  }

  // Both terms are bounded above, the sum cannot overflow.
  const std::int64_t interval_end = static_cast<std::int64_t>(key.interval_number) + count;
  if (!skip_key_still_valid && interval_end > max_interval_number) {
    throw PublishError(PublishErrorKind::kKeyStillValid,
                       "interval number " + std::to_string(key.interval_number) + " + interval count " + std::to_string(count) +
                           " represents a key that is still valid, must end <= " + std::to_string(max_interval_number),
                       {interval_end, std::nullopt, max_interval_number});
  }

  const auto risk = key.transmission_risk;
  if (risk < model::kMinTransmissionRisk || risk > model::kMaxTransmissionRisk) {
    throw PublishError(PublishErrorKind::kInvalidTransmissionRisk,
                       "invalid transmission risk: " + std::to_string(risk) + ", must be >= " +
                           std::to_string(model::kMinTransmissionRisk) + " && <= " + std::to_string(model::kMaxTransmissionRisk),
                       {risk, model::kMinTransmissionRisk, model::kMaxTransmissionRisk});
  }

  model::Exposure exposure;
  std::copy(decoded->begin(), decoded->end(), exposure.exposure_key.begin());
  exposure.transmission_risk = risk;
  exposure.app_package_name  = app_package_name;
  exposure.regions           = upcased_regions;
  exposure.interval_number   = key.interval_number;
  exposure.interval_count    = count;
  exposure.created_at        = created_at;
  exposure.local_provenance  = true;
  return exposure;
}

void ValidateAlignedOverlap(const std::vector<model::Exposure>& exposures) {
  if (exposures.empty()) {
    return;
  }

  std::vector<const model::Exposure*> sorted;
  sorted.reserve(exposures.size());
  for (const auto& exposure : exposures) {
    sorted.push_back(&exposure);
  }
  std::sort(sorted.begin(), sorted.end(), [](const model::Exposure* a, const model::Exposure* b) {
    if (a->interval_number == b->interval_number) {
      return a->interval_count < b->interval_count;
    }
    return a->interval_number < b->interval_number;
  });

  // [last_interval, next_interval) is the window covered by the current
  // group of keys sharing a start interval.
  std::int64_t last_interval = sorted.front()->interval_number;
  std::int64_t next_interval = last_interval + sorted.front()->interval_count;

  for (const auto* exposure : sorted) {
    if (exposure->interval_number == last_interval) {
      next_interval = static_cast<std::int64_t>(exposure->interval_number) + exposure->interval_count;
      continue;
    }

    if (exposure->interval_number < next_interval) {
      throw PublishError(PublishErrorKind::kMisalignedOverlap,
                         "exposure keys have non aligned overlapping intervals. " + std::to_string(exposure->interval_number) +
                             " overlaps with previous key that is good from " + std::to_string(last_interval) + " to " +
                             std::to_string(next_interval) + ".",
                         {exposure->interval_number, last_interval, next_interval});
    }

    last_interval = exposure->interval_number;
    next_interval = last_interval + exposure->interval_count;
  }
}

Transformer::Transformer(TransformerConfig config) : config_(Validated(std::move(config))) {
}

std::vector<model::Exposure> Transformer::TransformPublish(const model::Publish& publish, util::TimePoint batch_time) const {
  if (publish.keys.empty()) {
    throw PublishError(PublishErrorKind::kEmptyKeySet, "no exposure keys in publish request");
  }
  const auto key_count = static_cast<std::int64_t>(publish.keys.size());
  if (key_count > config_.max_exposure_keys) {
    throw PublishError(PublishErrorKind::kTooManyKeys,
                       "too many exposure keys in publish: " + std::to_string(key_count) + ", max of " +
                           std::to_string(config_.max_exposure_keys) + " is allowed",
                       {key_count, std::nullopt, config_.max_exposure_keys});
  }

  const auto created_at = model::TruncateWindow(batch_time, config_.truncate_window);

  // Shared acceptance window for every key in the batch.
  const auto min_interval_number = model::IntervalNumber(batch_time - config_.max_interval_start_age);
  const auto max_interval_number = model::IntervalNumber(batch_time);

  // Which regions an app may write to is the registry's concern, here they
  // are only normalized for storage.
  std::vector<std::string> upcased_regions;
  upcased_regions.reserve(publish.regions.size());
  for (const auto& region : publish.regions) {
    upcased_regions.push_back(model::UpcaseRegion(region));
  }

  std::vector<model::Exposure> exposures;
  exposures.reserve(publish.keys.size());
  for (const auto& key : publish.keys) {
    try {
      exposures.push_back(TransformExposureKey(key, publish.app_package_name, upcased_regions, created_at, min_interval_number,
                                               max_interval_number, config_.skip_key_still_valid_check));
    } catch (const PublishError& e) {
      throw PublishError::InvalidPublishData(e);
    }
  }

  ValidateAlignedOverlap(exposures);
  return exposures;
}

} // namespace keyserver::publish
