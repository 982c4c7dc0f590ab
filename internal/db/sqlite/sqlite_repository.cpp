#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <cstddef>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace keyserver::db::sqlite {

using keyserver::db::ErrorCode;
using keyserver::db::Result;

namespace {

constexpr const char* kSelectColumns =
    "SELECT exposure_key,transmission_risk,app_package_name,interval_number,interval_count,created_at_ms,local_provenance,sync_id "
    "FROM exposure";

constexpr const char* kSelectRegions = "SELECT region FROM exposure_region WHERE exposure_key=? ORDER BY position;";

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.data(), static_cast<int>(s.size()), SQLITE_TRANSIENT);
}

void BindBlob(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_blob(st, idx, s.data(), static_cast<int>(s.size()), SQLITE_TRANSIENT);
}

void BindI64(sqlite3_stmt* st, int idx, std::int64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindI32(sqlite3_stmt* st, int idx, int v) {
  sqlite3_bind_int(st, idx, v);
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t    = sqlite3_column_text(st, col);
  const int            size = sqlite3_column_bytes(st, col);
  return t ? std::string(reinterpret_cast<const char*>(t), static_cast<std::size_t>(size)) : std::string{};
}

std::string ColBlob(sqlite3_stmt* st, int col) {
  const void* data = sqlite3_column_blob(st, col);
  const int   size = sqlite3_column_bytes(st, col);
  return data ? std::string(static_cast<const char*>(data), static_cast<std::size_t>(size)) : std::string{};
}

model::ExposureRecord ReadRow(sqlite3_stmt* st) {
  model::ExposureRecord r;
  r.exposure_key      = ColBlob(st, 0);
  r.transmission_risk = sqlite3_column_int(st, 1);
  r.app_package_name  = ColText(st, 2);
  r.interval_number   = sqlite3_column_int(st, 3);
  r.interval_count    = sqlite3_column_int(st, 4);
  r.created_at_ms     = sqlite3_column_int64(st, 5);
  r.local_provenance  = sqlite3_column_int(st, 6) != 0;
  if (sqlite3_column_type(st, 7) != SQLITE_NULL) {
    r.sync_id = sqlite3_column_int64(st, 7);
  }
  return r;
}

// Regions in the order they were inserted. st is kSelectRegions, reset here
// so it can be reused across rows.
std::vector<std::string> ReadRegions(const SqliteDB& db, sqlite3_stmt* st, const std::string& exposure_key) {
  sqlite3_reset(st);
  sqlite3_clear_bindings(st);
  BindBlob(st, 1, exposure_key);

  std::vector<std::string> regions;
  int rc = SQLITE_ROW;
  while ((rc = sqlite3_step(st)) == SQLITE_ROW) {
    regions.push_back(ColText(st, 0));
  }
  if (rc != SQLITE_DONE) {
    throw std::runtime_error("sqlite region read failed: " + db.ErrorMessage());
  }
  return regions;
}

Statement PrepareOrThrow(const SqliteDB& db, const std::string& sql) {
  auto st        = PrepareOrThrow(db, sql);
  return st;
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(const SqliteDB& db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  // extended codes carry the primary code in the low byte
  switch (rc & 0xFF) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, db.ErrorMessage());
    case SQLITE_CONSTRAINT:
      return Result::Err(ErrorCode::ConstraintViolation, db.ErrorMessage());
    case SQLITE_IOERR:
    case SQLITE_FULL:
      return Result::Err(ErrorCode::IOError, db.ErrorMessage());
    case SQLITE_CORRUPT:
    case SQLITE_NOTADB:
      return Result::Err(ErrorCode::Corruption, db.ErrorMessage());
    default:
      return Result::Err(ErrorCode::InternalError, db.ErrorMessage());
  }
}

// ------------------------------------------------------------------
// Exposures
// ------------------------------------------------------------------

Result SqliteRepository::InsertExposures(Transaction& t, const std::vector<model::ExposureRecord>& records) {
  auto& db = TX(t).DB();

  auto st = db.Prepare(
      "INSERT INTO exposure(exposure_key,transmission_risk,app_package_name,interval_number,interval_count,created_at_ms,"
      "local_provenance,sync_id) VALUES(?,?,?,?,?,?,?,?);");
  if (!st) return Result::Err(ErrorCode::InternalError, db.ErrorMessage());

  auto region_st = db.Prepare("INSERT INTO exposure_region(exposure_key,position,region) VALUES(?,?,?);");
  if (!region_st) return Result::Err(ErrorCode::InternalError, db.ErrorMessage());

  for (const auto& r : records) {
    BindBlob(st.get(), 1, r.exposure_key);
    BindI32(st.get(), 2, r.transmission_risk);
    BindText(st.get(), 3, r.app_package_name);
    BindI32(st.get(), 4, r.interval_number);
    BindI32(st.get(), 5, r.interval_count);
    BindI64(st.get(), 6, r.created_at_ms);
    BindI32(st.get(), 7, r.local_provenance ? 1 : 0);
    if (r.sync_id) {
      BindI64(st.get(), 8, *r.sync_id);
    } else {
      sqlite3_bind_null(st.get(), 8);
    }

    const int rc = sqlite3_step(st.get());
    if (rc != SQLITE_DONE) {
      return Translate(db, rc);
    }
    sqlite3_reset(st.get());
    sqlite3_clear_bindings(st.get());

    for (std::size_t i = 0; i < r.regions.size(); ++i) {
      BindBlob(region_st.get(), 1, r.exposure_key);
      BindI32(region_st.get(), 2, static_cast<int>(i));
      BindText(region_st.get(), 3, r.regions[i]);

      const int region_rc = sqlite3_step(region_st.get());
      if (region_rc != SQLITE_DONE) {
        return Translate(db, region_rc);
      }
      sqlite3_reset(region_st.get());
      sqlite3_clear_bindings(region_st.get());
    }
  }

  return Result::Ok();
}

std::optional<model::ExposureRecord> SqliteRepository::GetExposure(Transaction& t, const std::string& exposure_key) {
  auto& db = TX(t).DB();

  auto st        = PrepareOrThrow(db, std::string(kSelectColumns) + " WHERE exposure_key=?;");
  auto region_st = PrepareOrThrow(db, kSelectRegions);

  BindBlob(st.get(), 1, exposure_key);

  const int rc = sqlite3_step(st.get());
  if (rc == SQLITE_DONE) return std::nullopt;
  if (rc != SQLITE_ROW) {
    throw std::runtime_error("sqlite read failed: " + db.ErrorMessage());
  }

  auto r    = ReadRow(st.get());
  r.regions = ReadRegions(db, region_st.get(), r.exposure_key);
  return r;
}

std::vector<model::ExposureRecord> SqliteRepository::ListExposures(Transaction& t, const ExposureQuery& query) {
  auto& db = TX(t).DB();

  std::string sql = kSelectColumns;
  sql += " WHERE created_at_ms >= ? AND created_at_ms < ?";
  if (query.only_local_provenance) {
    sql += " AND local_provenance = 1";
  }
  sql += " ORDER BY created_at_ms, exposure_key;";

  auto st = db.Prepare(sql);
  if (!st) {
    throw std::runtime_error("sqlite prepare failed: " + db.ErrorMessage());
  }
  auto region_st = PrepareOrThrow(db, kSelectRegions);

  BindI64(st.get(), 1, query.created_after_ms.value_or(std::numeric_limits<std::int64_t>::min()));
  BindI64(st.get(), 2, query.created_before_ms.value_or(std::numeric_limits<std::int64_t>::max()));

  std::vector<model::ExposureRecord> out;
  int rc = SQLITE_ROW;
  while ((rc = sqlite3_step(st.get())) == SQLITE_ROW) {
    auto r    = ReadRow(st.get());
    r.regions = ReadRegions(db, region_st.get(), r.exposure_key);
    if (!model::MatchesQuery(r, query)) continue;
    out.push_back(std::move(r));
    if (query.limit && out.size() >= *query.limit) return out;
  }
  if (rc != SQLITE_DONE) {
    throw std::runtime_error("sqlite read failed: " + db.ErrorMessage());
  }
  return out;
}

} // namespace keyserver::db::sqlite
