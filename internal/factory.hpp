#pragma once

#include <memory>

#include "config/config.pb.h"

#include "internal/db/api/repository.hpp"
#include "internal/publish/transformer.hpp"
#include "internal/service/publish_service.hpp"

namespace keyserver::factory {

/*
  Application

  Owns all long-lived singletons used by the process.
*/
struct Application {
  std::shared_ptr<db::Repository> repository;
  std::shared_ptr<service::PublishService> publish_service;
};

// Publish policy from config, with defaults for unset fields.
publish::TransformerConfig BuildTransformerConfig(const keyserver::runtime::config::RuntimeConfig& config);

/*
  Build

  Constructs the entire backend based on runtime config.

  NOTE:
  This is the composition root of the application.
  It is the ONLY place allowed to know concrete DB types.
*/
Application Build(const keyserver::runtime::config::RuntimeConfig& config);

} // namespace keyserver::factory
