#include "factory.hpp"

#include <google/protobuf/util/time_util.h>

#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

#include "internal/authorizedapp/authorized_app_registry.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/observability/logging.hpp"
#include "internal/service/service_context.hpp"
#include "internal/util/errors.hpp"
#if KEYSERVER_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/db/sqlite/sqlite_schema.hpp"
#endif

namespace keyserver::factory {

using namespace keyserver;
using google::protobuf::util::TimeUtil;

namespace {

std::shared_ptr<db::Repository> BuildRepository(const keyserver::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if KEYSERVER_DB_SQLITE
    if (database.sqlite().path().empty()) {
      throw util::InvalidConfig("database.sqlite.path is required");
    }
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path());
    db::sqlite::BootstrapSchema(*sqlite_db);
    KEYSERVER_LOG_INFO("using sqlite repository", {observability::StringField("path", sqlite_db->Path())});
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw util::InvalidConfig("sqlite backend requested but not enabled at build time");
#endif
  }

  KEYSERVER_LOG_INFO("using in-memory repository");
  return std::make_shared<db::memory::MemoryRepository>();
}

} // namespace

publish::TransformerConfig BuildTransformerConfig(const keyserver::runtime::config::RuntimeConfig& config) {
  const auto& settings = config.publish();

  publish::TransformerConfig transformer_config;
  if (settings.max_exposure_keys() != 0) {
    transformer_config.max_exposure_keys = static_cast<int>(settings.max_exposure_keys());
  }
  if (settings.has_max_interval_start_age()) {
    transformer_config.max_interval_start_age = std::chrono::seconds(TimeUtil::DurationToSeconds(settings.max_interval_start_age()));
  }
  if (settings.has_truncate_window()) {
    transformer_config.truncate_window = std::chrono::seconds(TimeUtil::DurationToSeconds(settings.truncate_window()));
  }
  transformer_config.skip_key_still_valid_check = settings.skip_key_still_valid_check();
  return transformer_config;
}

/*
    Build full application dependency graph
*/
Application Build(const keyserver::runtime::config::RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Core components
  // ------------------------------------------------------------------
  auto transformer_config = BuildTransformerConfig(config);
  auto transformer        = std::make_shared<const publish::Transformer>(transformer_config);
  auto registry = std::make_shared<const authorizedapp::AuthorizedAppRegistry>(authorizedapp::AuthorizedAppRegistry::FromConfig(config));

  if (transformer_config.skip_key_still_valid_check) {
    KEYSERVER_LOG_WARN("key still valid check is disabled, do not run this configuration in production");
  }
  if (registry->size() == 0) {
    KEYSERVER_LOG_WARN("no authorized apps configured, every publish will be rejected");
  }

  app.repository = BuildRepository(config);

  // ------------------------------------------------------------------
  // Services
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.transformer = transformer;
  ctx.registry    = registry;
  ctx.repository  = app.repository;

  app.publish_service = std::make_shared<service::PublishService>(ctx);

  KEYSERVER_LOG_INFO("publish pipeline configured",
                     {observability::IntField("max_exposure_keys", transformer_config.max_exposure_keys),
                      observability::IntField("max_interval_start_age_s", transformer_config.max_interval_start_age.count()),
                      observability::IntField("truncate_window_s", transformer_config.truncate_window.count()),
                      observability::BoolField("skip_key_still_valid_check", transformer_config.skip_key_still_valid_check),
                      observability::IntField("authorized_apps", static_cast<std::int64_t>(registry->size()))});

  return app;
}

} // namespace keyserver::factory
