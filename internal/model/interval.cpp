#include "internal/model/interval.hpp"

namespace keyserver::model {

std::int32_t IntervalNumber(util::TimePoint t) {
  const std::int64_t seconds = std::chrono::floor<std::chrono::seconds>(t.time_since_epoch()).count();
  const std::int64_t length  = kIntervalLength.count();

  std::int64_t interval = seconds / length;
  if (seconds % length < 0) {
    --interval;
  }
  return static_cast<std::int32_t>(interval);
}

util::TimePoint TruncateWindow(util::TimePoint t, std::chrono::seconds window) {
  if (window <= std::chrono::seconds::zero()) {
    return t;
  }

  const auto since_epoch = t.time_since_epoch();
  const auto remainder   = since_epoch % window;
  auto       truncated   = since_epoch - remainder;
  // % keeps the sign of the dividend; pre-epoch times still round down.
  if (remainder < util::Clock::duration::zero()) {
    truncated -= window;
  }
  return util::TimePoint(std::chrono::duration_cast<util::Clock::duration>(truncated));
}

} // namespace keyserver::model
