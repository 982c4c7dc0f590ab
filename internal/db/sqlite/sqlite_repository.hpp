#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace keyserver::db::sqlite {

/*
  Exposure rows plus one exposure_region row per region, kept in request
  order, see sqlite_schema.cpp. Region filtering happens after the SQL query.
*/
class SqliteRepository final : public db::Repository {
 public:
  // Expects BootstrapSchema to have run on db.
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;

  Result InsertExposures(Transaction&, const std::vector<model::ExposureRecord>&) override;
  std::optional<model::ExposureRecord> GetExposure(Transaction&, const std::string&) override;
  std::vector<model::ExposureRecord> ListExposures(Transaction&, const ExposureQuery&) override;

 private:
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result Translate(const SqliteDB& db, int rc);
};

} // namespace keyserver::db::sqlite
