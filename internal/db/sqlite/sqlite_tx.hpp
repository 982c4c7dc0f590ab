#pragma once

#include <memory>

#include "internal/db/api/transaction.hpp"
#include "sqlite_db.hpp"

namespace keyserver::db::sqlite {

/*
  BEGIN IMMEDIATE takes the write lock up front, so a publish batch never
  fails half way through on SQLITE_BUSY. The connection is shared; a second
  transaction on it throws until this one is finished.
*/
class SqliteTransaction final : public db::Transaction {
 public:
  explicit SqliteTransaction(std::shared_ptr<SqliteDB> db);
  ~SqliteTransaction() override;

  SqliteTransaction(const SqliteTransaction&)            = delete;
  SqliteTransaction& operator=(const SqliteTransaction&) = delete;

  void Commit() override;
  void Rollback() override;

  bool IsCommitted() const override {
    return state_ == State::kCommitted;
  }

  bool IsFinished() const override {
    return state_ != State::kOpen;
  }

  SqliteDB& DB() const {
    return *db_;
  }

 private:
  enum class State { kOpen, kCommitted, kRolledBack };

  std::shared_ptr<SqliteDB> db_;
  State                     state_ = State::kOpen;
};

} // namespace keyserver::db::sqlite
