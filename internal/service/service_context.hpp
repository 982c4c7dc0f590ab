#pragma once

#include <memory>

namespace keyserver::publish { class Transformer; }
namespace keyserver::authorizedapp { class AuthorizedAppRegistry; }
namespace keyserver::db { class Repository; }

namespace keyserver::service {

/*
  Dependency container shared by all services.
*/
struct ServiceContext {
  std::shared_ptr<const keyserver::publish::Transformer> transformer;
  std::shared_ptr<const keyserver::authorizedapp::AuthorizedAppRegistry> registry;
  std::shared_ptr<keyserver::db::Repository> repository;
};

}
