#include "internal/authorizedapp/authorized_app_registry.hpp"

#include <cassert>
#include <functional>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include "internal/config/config_loader.hpp"
#include "internal/util/errors.hpp"

namespace {

using keyserver::authorizedapp::AuthorizedApp;
using keyserver::authorizedapp::AuthorizedAppRegistry;
using keyserver::model::Publish;

AuthorizedAppRegistry SampleRegistry() {
  auto config = keyserver::config::ConfigLoader::LoadFromYamlString(R"(authorized_apps:
  - app_package_name: com.example.android
    platform: Android
    allowed_regions: [us, CA]
  - app_package_name: com.example.any
    allowed_regions: [DE]
)");
  return AuthorizedAppRegistry::FromConfig(config);
}

Publish PublishFrom(const std::string& app, const std::string& platform, std::vector<std::string> regions) {
  Publish publish;
  publish.app_package_name = app;
  publish.platform         = platform;
  publish.regions          = std::move(regions);
  return publish;
}

template <typename Error>
void ExpectThrows(const std::function<void()>& fn) {
  bool threw = false;
  try {
    fn();
  } catch (const Error&) {
    threw = true;
  }
  assert(threw);
}

void TestFromConfigNormalizesCase() {
  const auto registry = SampleRegistry();
  assert(registry.size() == 2);

  const auto& app = registry.Lookup("com.example.android");
  assert(app.platform == "android");
  assert(app.IsAllowedRegion("US"));
  assert(app.IsAllowedRegion("CA"));
  assert(!app.IsAllowedRegion("us"));
}

void TestAuthorizeAcceptsAllowedRegions() {
  const auto registry = SampleRegistry();

  const auto& app = registry.Authorize(PublishFrom("com.example.android", "ANDROID", {"us", "ca"}));
  assert(app.app_package_name == "com.example.android");

  // No regions requested is not a region violation.
  registry.Authorize(PublishFrom("com.example.android", "android", {}));

  // Unset platform on either side matches anything.
  registry.Authorize(PublishFrom("com.example.android", "", {"US"}));
  registry.Authorize(PublishFrom("com.example.any", "ios", {"de"}));
}

void TestAuthorizeRejectsUnknownApp() {
  const auto registry = SampleRegistry();
  ExpectThrows<keyserver::util::NotFound>([&] { registry.Authorize(PublishFrom("com.example.unknown", "android", {"US"})); });
  ExpectThrows<keyserver::util::NotFound>([&] { registry.Lookup("com.example.unknown"); });
}

void TestAuthorizeRejectsRegionAndPlatform() {
  const auto registry = SampleRegistry();
  ExpectThrows<keyserver::util::PermissionDenied>(
      [&] { registry.Authorize(PublishFrom("com.example.android", "android", {"US", "MX"})); });
  ExpectThrows<keyserver::util::PermissionDenied>(
      [&] { registry.Authorize(PublishFrom("com.example.android", "ios", {"US"})); });
}

void TestConstructorRejectsBadEntries() {
  ExpectThrows<keyserver::util::InvalidConfig>([] {
    AuthorizedAppRegistry registry({AuthorizedApp{"com.example.app", "", {}}, AuthorizedApp{"com.example.app", "", {}}});
  });
  ExpectThrows<keyserver::util::InvalidConfig>([] { AuthorizedAppRegistry registry({AuthorizedApp{"", "android", {}}}); });
}

void TestNonAsciiRegions() {
  const auto registry = SampleRegistry();
  ExpectThrows<keyserver::util::InvalidArgument>(
      [&] { registry.Authorize(PublishFrom("com.example.any", "", {"DE", "\xc3\xbc"})); });

  const auto config = keyserver::config::ConfigLoader::LoadFromYamlString(
      "authorized_apps:\n  - app_package_name: com.example.app\n    allowed_regions: [\"\xc3\xbc\"]\n");
  ExpectThrows<keyserver::util::InvalidConfig>([&] { AuthorizedAppRegistry::FromConfig(config); });
}

} // namespace

int main() {
  TestFromConfigNormalizesCase();
  TestAuthorizeAcceptsAllowedRegions();
  TestAuthorizeRejectsUnknownApp();
  TestAuthorizeRejectsRegionAndPlatform();
  TestConstructorRejectsBadEntries();
  TestNonAsciiRegions();

  std::cout << "keyserver_unit_authorized_app_registry: pass\n";
  return 0;
}
