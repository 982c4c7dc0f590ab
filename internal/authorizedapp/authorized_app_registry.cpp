#include "internal/authorizedapp/authorized_app_registry.hpp"

#include <absl/strings/ascii.h>

#include "internal/model/region.hpp"
#include "internal/util/errors.hpp"

namespace keyserver::authorizedapp {

AuthorizedAppRegistry::AuthorizedAppRegistry(std::vector<AuthorizedApp> apps) {
  for (auto& app : apps) {
    if (app.app_package_name.empty()) {
      throw util::InvalidConfig("authorized app without app_package_name");
    }
    auto name = app.app_package_name;
    if (!apps_.emplace(name, std::move(app)).second) {
      throw util::InvalidConfig("duplicate authorized app: " + name);
    }
  }
}

AuthorizedAppRegistry AuthorizedAppRegistry::FromConfig(const keyserver::runtime::config::RuntimeConfig& config) {
  std::vector<AuthorizedApp> apps;
  apps.reserve(config.authorized_apps_size());

  for (const auto& entry : config.authorized_apps()) {
    AuthorizedApp app;
    app.app_package_name = entry.app_package_name();
    app.platform         = absl::AsciiStrToLower(entry.platform());
    for (const auto& region : entry.allowed_regions()) {
      try {
        app.allowed_regions.insert(model::UpcaseRegion(region));
      } catch (const util::InvalidArgument& e) {
        throw util::InvalidConfig("authorized app " + app.app_package_name + ": " + e.what());
      }
    }
    apps.push_back(std::move(app));
  }

  return AuthorizedAppRegistry(std::move(apps));
}

const AuthorizedApp& AuthorizedAppRegistry::Lookup(const std::string& app_package_name) const {
  auto it = apps_.find(app_package_name);
  if (it == apps_.end()) {
    throw util::NotFound("unauthorized app: " + app_package_name);
  }
  return it->second;
}

const AuthorizedApp& AuthorizedAppRegistry::Authorize(const model::Publish& publish) const {
  const auto& app = Lookup(publish.app_package_name);

  const auto platform = absl::AsciiStrToLower(publish.platform);
  if (!app.platform.empty() && !platform.empty() && platform != app.platform) {
    throw util::PermissionDenied("app " + app.app_package_name + " is not authorized for platform " + publish.platform);
  }

  for (const auto& region : publish.regions) {
    const auto upcased = model::UpcaseRegion(region);
    if (!app.IsAllowedRegion(upcased)) {
      throw util::PermissionDenied("app " + app.app_package_name + " tried to write unauthorized region " + upcased);
    }
  }

  return app;
}

} // namespace keyserver::authorizedapp
