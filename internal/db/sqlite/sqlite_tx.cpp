#include "sqlite_tx.hpp"

#include <exception>
#include <stdexcept>
#include <utility>

#include "internal/observability/logging.hpp"

namespace keyserver::db::sqlite {

SqliteTransaction::SqliteTransaction(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
  db_->Exec("BEGIN IMMEDIATE;");
}

SqliteTransaction::~SqliteTransaction() {
  if (state_ != State::kOpen) {
    return;
  }
  try {
    db_->Exec("ROLLBACK;");
  } catch (const std::exception& e) {
    KEYSERVER_LOG_WARN("sqlite rollback failed", {observability::StringField("db", db_->Path()),
                                                  observability::StringField("error", e.what())});
  }
}

void SqliteTransaction::Commit() {
  if (state_ != State::kOpen) {
    throw std::runtime_error("commit on finished sqlite transaction");
  }
  db_->Exec("COMMIT;");
  state_ = State::kCommitted;
}

void SqliteTransaction::Rollback() {
  if (state_ != State::kOpen) {
    return;
  }
  state_ = State::kRolledBack;
  db_->Exec("ROLLBACK;");
}

} // namespace keyserver::db::sqlite
