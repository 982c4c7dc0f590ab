#pragma once

#include <array>
#include <cstdint>
#include <string_view>

namespace keyserver::crypto {

using Sha256Digest = std::array<std::uint8_t, 32>;

// Throws std::runtime_error if OpenSSL fails.
Sha256Digest Sha256(std::string_view data);

} // namespace keyserver::crypto
