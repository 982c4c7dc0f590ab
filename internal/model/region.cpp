#include "internal/model/region.hpp"

#include <absl/strings/ascii.h>

#include <algorithm>

#include "internal/util/errors.hpp"

namespace keyserver::model {

void ValidateRegion(std::string_view region) {
  const bool ascii =
      std::all_of(region.begin(), region.end(), [](char c) { return absl::ascii_isascii(static_cast<unsigned char>(c)); });
  if (!ascii) {
    throw util::InvalidArgument("region code must be ASCII: " + std::string(region));
  }
}

std::string UpcaseRegion(std::string_view region) {
  ValidateRegion(region);
  return absl::AsciiStrToUpper(absl::string_view(region.data(), region.size()));
}

} // namespace keyserver::model
