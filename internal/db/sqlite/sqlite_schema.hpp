#pragma once

#include "sqlite_db.hpp"

namespace keyserver::db::sqlite {

// Creates the exposure table and its indexes if missing. Idempotent.
void BootstrapSchema(SqliteDB& db);

} // namespace keyserver::db::sqlite
