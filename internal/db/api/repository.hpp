#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/api/types.hpp"
#include "internal/db/model/exposure_record.hpp"

namespace keyserver::db {

/*
  Repository abstraction for published exposures.

  CRITICAL GUARANTEES:

  - All writes require a Transaction
  - Reads inside a transaction see its writes
  - A batch is inserted in one transaction; a failed insert leaves the
    transaction to be rolled back by the caller
  - Writes report failure through Result; reads throw std::runtime_error
    when the backend fails

  Exposure keys are unique across the store.
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Exposures
  // ---------------------------------------------------------------------

  virtual Result InsertExposures(Transaction&, const std::vector<model::ExposureRecord>&) = 0;

  virtual std::optional<model::ExposureRecord> GetExposure(Transaction&, const std::string& exposure_key) = 0;

  // Ordered by created_at, then exposure key.
  virtual std::vector<model::ExposureRecord> ListExposures(Transaction&, const ExposureQuery&) = 0;
};

} // namespace keyserver::db
