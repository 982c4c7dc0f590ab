#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace keyserver::db {

/*
  Selection of stored exposures, as used by readers such as the export
  pipeline. Unset fields do not filter.
*/
struct ExposureQuery {
  // [created_after_ms, created_before_ms)
  std::optional<std::int64_t> created_after_ms;
  std::optional<std::int64_t> created_before_ms;

  // Upper case region code.
  std::optional<std::string> region;

  bool only_local_provenance = false;

  std::optional<std::size_t> limit;
};

} // namespace keyserver::db
