#include "internal/publish/canonical.hpp"

#include <absl/strings/str_join.h>

#include <algorithm>
#include <vector>

#include "internal/crypto/sha256.hpp"
#include "internal/model/region.hpp"
#include "internal/util/base64.hpp"

namespace keyserver::publish {

namespace {

std::string RenderKey(const model::ExposureKey& key) {
  return key.key + "." + std::to_string(key.interval_number) + "." + std::to_string(key.interval_count) + "." +
         std::to_string(key.transmission_risk);
}

} // namespace

std::string CanonicalCleartext(const model::Publish& publish) {
  std::vector<model::ExposureKey> sorted_keys(publish.keys);
  std::sort(sorted_keys.begin(), sorted_keys.end(),
            [](const model::ExposureKey& a, const model::ExposureKey& b) { return a.key < b.key; });

  std::vector<std::string> sorted_regions;
  sorted_regions.reserve(publish.regions.size());
  for (const auto& region : publish.regions) {
    sorted_regions.push_back(model::UpcaseRegion(region));
  }
  std::sort(sorted_regions.begin(), sorted_regions.end());

  std::vector<std::string> keys;
  keys.reserve(sorted_keys.size());
  for (const auto& key : sorted_keys) {
    keys.push_back(RenderKey(key));
  }

  return publish.app_package_name + "|" + absl::StrJoin(keys, ",") + "|" + absl::StrJoin(sorted_regions, ",") + "|" +
         publish.verification_payload;
}

std::string AttestationNonce(const model::Publish& publish) {
  const auto cleartext = CanonicalCleartext(publish);
  const auto digest    = crypto::Sha256(cleartext);
  return util::Base64Encode(std::string_view(reinterpret_cast<const char*>(digest.data()), digest.size()));
}

} // namespace keyserver::publish
