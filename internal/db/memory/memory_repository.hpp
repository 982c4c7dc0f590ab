#pragma once

#include <cstdint>
#include <map>
#include <mutex>

#include "internal/db/api/repository.hpp"

namespace keyserver::db::memory {

class MemoryTransaction;

/*
  Process local exposure store for tests and single node trials.
  Contents are lost on exit.
*/
class MemoryRepository final : public db::Repository {
 public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result InsertExposures(Transaction&, const std::vector<model::ExposureRecord>&) override;
  std::optional<model::ExposureRecord> GetExposure(Transaction&, const std::string&) override;
  std::vector<model::ExposureRecord> ListExposures(Transaction&, const ExposureQuery&) override;

 private:
  friend class MemoryTransaction;

  // Keyed by raw exposure key.
  using Exposures = std::map<std::string, model::ExposureRecord>;

  std::mutex    mutex_;
  Exposures     exposures_;
  std::uint64_t generation_ = 0;
};

} // namespace keyserver::db::memory
