#pragma once

#include <chrono>
#include <cstdint>
#include <string>

#include "google/protobuf/timestamp.pb.h"

namespace keyserver::util {

/*
  Wall clock and conversions.

  Batch times, created_at and stored timestamps are all system_clock based;
  the database keeps Unix milliseconds.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

google::protobuf::Timestamp ToProto(TimePoint tp);
TimePoint                   FromProto(const google::protobuf::Timestamp& ts);

std::int64_t ToUnixMillis(TimePoint tp);
TimePoint    FromUnixMillis(std::int64_t ms);

// RFC 3339, e.g. "2021-06-01T00:00:00Z". Throws InvalidArgument.
TimePoint   ParseRfc3339(const std::string& value);
std::string FormatRfc3339(TimePoint tp);

} // namespace keyserver::util
