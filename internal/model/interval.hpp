#pragma once

#include <chrono>
#include <cstdint>

#include "internal/util/time.hpp"

namespace keyserver::model {

// Keys are scheduled in 10 minute intervals.
inline constexpr std::chrono::seconds kIntervalLength = std::chrono::minutes(10);

// Interval number of t: floor(unix seconds / 600).
std::int32_t IntervalNumber(util::TimePoint t);

// Truncates t to the preceding multiple of window, measured from the Unix
// epoch. A non-positive window leaves t unchanged.
util::TimePoint TruncateWindow(util::TimePoint t, std::chrono::seconds window);

} // namespace keyserver::model
