#include "memory_tx.hpp"

#include <mutex>
#include <stdexcept>
#include <string>
#include <utility>

namespace keyserver::db::memory {

MemoryTransaction::MemoryTransaction(MemoryRepository& repo) : repo_(repo) {
  std::scoped_lock lock(repo_.mutex_);
  exposures_       = repo_.exposures_;
  base_generation_ = repo_.generation_;
}

MemoryTransaction::~MemoryTransaction() {
  if (state_ == State::kOpen) {
    Rollback();
  }
}

void MemoryTransaction::RequireOpen(const char* operation) const {
  if (state_ != State::kOpen) {
    throw std::runtime_error(std::string(operation) + " on finished memory transaction");
  }
}

MemoryRepository::Exposures& MemoryTransaction::Writable() {
  RequireOpen("write");
  return exposures_;
}

const MemoryRepository::Exposures& MemoryTransaction::Readable() const {
  RequireOpen("read");
  return exposures_;
}

void MemoryTransaction::Commit() {
  RequireOpen("commit");

  std::scoped_lock lock(repo_.mutex_);
  if (repo_.generation_ != base_generation_) {
    throw std::runtime_error("exposure batch conflicts with a concurrently committed batch");
  }
  repo_.exposures_ = std::move(exposures_);
  ++repo_.generation_;
  state_ = State::kCommitted;
}

void MemoryTransaction::Rollback() {
  exposures_.clear();
  state_ = State::kRolledBack;
}

} // namespace keyserver::db::memory
