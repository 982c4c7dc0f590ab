#pragma once

#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "config/config.pb.h"
#include "internal/model/publish.hpp"

namespace keyserver::authorizedapp {

struct AuthorizedApp {
  std::string app_package_name;

  // Lower case. Empty accepts any platform.
  std::string platform;

  // Upper case.
  std::unordered_set<std::string> allowed_regions;

  bool IsAllowedRegion(const std::string& upcased_region) const {
    return allowed_regions.contains(upcased_region);
  }
};

/*
  Applications permitted to publish, and where they may publish to.

  Read-only after construction.
*/
class AuthorizedAppRegistry {
 public:
  explicit AuthorizedAppRegistry(std::vector<AuthorizedApp> apps);

  // Throws util::InvalidConfig on duplicate or empty package names.
  static AuthorizedAppRegistry FromConfig(const keyserver::runtime::config::RuntimeConfig& config);

  // Throws util::NotFound.
  const AuthorizedApp& Lookup(const std::string& app_package_name) const;

  /*
    Checks that the publishing app is known, that the request platform
    matches the configured one and that every region is allowed.

    Throws util::NotFound or util::PermissionDenied.
  */
  const AuthorizedApp& Authorize(const model::Publish& publish) const;

  std::size_t size() const {
    return apps_.size();
  }

 private:
  std::unordered_map<std::string, AuthorizedApp> apps_;
};

} // namespace keyserver::authorizedapp
