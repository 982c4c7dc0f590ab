#pragma once

#include <string>
#include <string_view>

namespace keyserver::model {

// Throws util::InvalidArgument unless every byte of region is ASCII.
void ValidateRegion(std::string_view region);

// ASCII upper-case of a validated region code.
std::string UpcaseRegion(std::string_view region);

} // namespace keyserver::model
