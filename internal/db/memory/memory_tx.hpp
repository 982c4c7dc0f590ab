#pragma once

#include <cstdint>

#include "internal/db/api/transaction.hpp"
#include "memory_repository.hpp"

namespace keyserver::db::memory {

/*
  Works on a private copy of the committed exposures.

  Commit swaps the copy in, unless another transaction committed since the
  copy was taken; then it throws and the batch is lost.
*/
class MemoryTransaction final : public db::Transaction {
 public:
  explicit MemoryTransaction(MemoryRepository& repo);
  ~MemoryTransaction() override;

  void Commit() override;
  void Rollback() override;

  bool IsCommitted() const override {
    return state_ == State::kCommitted;
  }

  bool IsFinished() const override {
    return state_ != State::kOpen;
  }

  // Throws std::runtime_error once finished.
  MemoryRepository::Exposures& Writable();
  const MemoryRepository::Exposures& Readable() const;

 private:
  enum class State { kOpen, kCommitted, kRolledBack };

  void RequireOpen(const char* operation) const;

  MemoryRepository&           repo_;
  MemoryRepository::Exposures exposures_;
  std::uint64_t               base_generation_ = 0;
  State                       state_           = State::kOpen;
};

} // namespace keyserver::db::memory
