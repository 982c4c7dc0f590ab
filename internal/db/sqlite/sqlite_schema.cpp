#include "sqlite_schema.hpp"

#include <string>
#include <vector>

namespace keyserver::db::sqlite {

void BootstrapSchema(SqliteDB& db) {
  static const std::vector<std::string> kBootstrapSql = {
      "CREATE TABLE IF NOT EXISTS exposure (exposure_key BLOB PRIMARY KEY, transmission_risk INTEGER NOT NULL, app_package_name TEXT NOT NULL, interval_number INTEGER NOT NULL, interval_count INTEGER NOT NULL, created_at_ms INTEGER NOT NULL, local_provenance INTEGER NOT NULL, sync_id INTEGER);",
      "CREATE INDEX IF NOT EXISTS exposure_created_at_idx ON exposure (created_at_ms);",
      "CREATE TABLE IF NOT EXISTS exposure_region (exposure_key BLOB NOT NULL REFERENCES exposure(exposure_key) ON DELETE CASCADE, position INTEGER NOT NULL, region TEXT NOT NULL, PRIMARY KEY (exposure_key, position));",
      "CREATE TABLE IF NOT EXISTS exposure_schema_migrations (version INTEGER PRIMARY KEY, applied_at_ms INTEGER NOT NULL);",
      "INSERT OR IGNORE INTO exposure_schema_migrations (version, applied_at_ms) VALUES (1, CAST(strftime('%s','now') AS INTEGER) * 1000);"};

  for (const auto& sql : kBootstrapSql) {
    db.Exec(sql);
  }

  db.Exec("SELECT exposure_key,transmission_risk,app_package_name,interval_number,interval_count,created_at_ms,local_provenance,sync_id FROM exposure LIMIT 1;");
  db.Exec("SELECT exposure_key,position,region FROM exposure_region LIMIT 1;");
}

} // namespace keyserver::db::sqlite
