#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace keyserver::model {

// Decoded length of every temporary exposure key.
inline constexpr std::size_t kKeyLength = 16;

// Transmission risk, inclusive range. 0 means no or unknown risk.
inline constexpr int kMinTransmissionRisk = 0;
inline constexpr int kMaxTransmissionRisk = 8;

// Interval count, inclusive range. 144 intervals of 10 minutes is one day.
inline constexpr std::int32_t kMinIntervalCount = 1;
inline constexpr std::int32_t kMaxIntervalCount = 144;

// 21 days worth of keys is the hard ceiling for one publish request.
inline constexpr int kMaxKeysPerPublish = 21;

/*
  One key as reported by a device.

  key is still in its transport (base64) encoding; nothing here has been
  validated yet.
*/
struct ExposureKey {
  std::string  key;
  std::int32_t interval_number = 0;
  std::int32_t interval_count  = 0;
  int          transmission_risk = 0;
};

} // namespace keyserver::model
