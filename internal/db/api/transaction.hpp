#pragma once

namespace keyserver::db {

/*
  Unit of work for one publish batch.

  Every exposure inserted through the transaction becomes visible at Commit(),
  or none does. Reads through the transaction see its own inserts.
  A transaction that is destroyed unfinished is rolled back.

  Memory: private copy of the committed exposures, swapped in on commit
  SQLite: BEGIN IMMEDIATE on the shared connection, one writer at a time
*/
class Transaction {
 public:
  virtual ~Transaction() = default;

  // Throws std::runtime_error if already finished or if the backend refuses
  // the commit (conflict, busy, I/O).
  virtual void Commit() = 0;

  virtual void Rollback() = 0;

  virtual bool IsCommitted() const = 0;

  // Commit() or Rollback() ran.
  virtual bool IsFinished() const = 0;
};

} // namespace keyserver::db
