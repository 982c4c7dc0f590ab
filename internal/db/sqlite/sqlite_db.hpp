#pragma once

#include <sqlite3.h>

#include <memory>
#include <string>

namespace keyserver::db::sqlite {

struct StatementFinalizer {
  void operator()(sqlite3_stmt* stmt) const {
    sqlite3_finalize(stmt);
  }
};

using Statement = std::unique_ptr<sqlite3_stmt, StatementFinalizer>;

/*
  Owns one sqlite3 connection to the exposure database.

  Opened in serialized (FULLMUTEX) mode with WAL journaling. Throws
  std::runtime_error if the file cannot be opened or configured.
*/
class SqliteDB {
 public:
  explicit SqliteDB(std::string path);
  ~SqliteDB();

  SqliteDB(const SqliteDB&)            = delete;
  SqliteDB& operator=(const SqliteDB&) = delete;

  sqlite3* Handle() const {
    return db_;
  }

  const std::string& Path() const {
    return path_;
  }

  // Runs one or more statements without results. Throws on error.
  void Exec(const std::string& sql);

  // Empty on error; the reason is in ErrorMessage().
  Statement Prepare(const std::string& sql) const;

  std::string ErrorMessage() const;

 private:
  void Configure();

  sqlite3*    db_ = nullptr;
  std::string path_;
};

} // namespace keyserver::db::sqlite
