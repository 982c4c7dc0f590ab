#include "internal/util/base64.hpp"

#include <absl/strings/ascii.h>
#include <absl/strings/escaping.h>

#include <algorithm>

namespace keyserver::util {

std::optional<std::string> Base64Decode(std::string_view encoded) {
  // absl skips whitespace inside the input; a key never carries any.
  if (std::any_of(encoded.begin(), encoded.end(), [](char c) { return absl::ascii_isspace(static_cast<unsigned char>(c)); })) {
    return std::nullopt;
  }

  std::size_t padding = 0;
  while (padding < encoded.size() && encoded[encoded.size() - 1 - padding] == '=') {
    ++padding;
  }
  if (padding > 2 || (padding > 0 && encoded.size() % 4 != 0)) {
    return std::nullopt;
  }
  encoded.remove_suffix(padding);
  if (encoded.size() % 4 == 1) {
    return std::nullopt;
  }
  if (encoded.empty()) {
    return std::string{};
  }

  std::string decoded;
  if (absl::Base64Unescape(absl::string_view(encoded.data(), encoded.size()), &decoded)) {
    return decoded;
  }
  if (absl::WebSafeBase64Unescape(absl::string_view(encoded.data(), encoded.size()), &decoded)) {
    return decoded;
  }
  return std::nullopt;
}

std::string Base64Encode(std::string_view raw) {
  return absl::Base64Escape(absl::string_view(raw.data(), raw.size()));
}

} // namespace keyserver::util
