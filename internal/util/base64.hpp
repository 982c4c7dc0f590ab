#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace keyserver::util {

/*
  base64 helpers for exposure keys and digests.

  Clients are not consistent about the alphabet or about padding, so decoding
  accepts the standard and the URL-safe alphabet, padded or not. Padding, when
  present, must be the one or two '=' the length calls for, and whitespace is
  rejected. Encoding is always standard and padded.
*/

std::optional<std::string> Base64Decode(std::string_view encoded);

std::string Base64Encode(std::string_view raw);

} // namespace keyserver::util
