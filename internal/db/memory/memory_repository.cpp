#include "memory_repository.hpp"

#include <algorithm>

#include "memory_tx.hpp"

namespace keyserver::db::memory {

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

Result MemoryRepository::InsertExposures(Transaction& t, const std::vector<model::ExposureRecord>& records) {
  auto& exposures = TX(t).Writable();
  for (const auto& r : records) {
    if (!exposures.emplace(r.exposure_key, r).second) {
      return Result::Err(ErrorCode::AlreadyExists, "duplicate exposure key");
    }
  }
  return Result::Ok();
}

std::optional<model::ExposureRecord> MemoryRepository::GetExposure(Transaction& t, const std::string& exposure_key) {
  const auto& exposures = TX(t).Readable();
  auto        it        = exposures.find(exposure_key);
  if (it == exposures.end()) return std::nullopt;
  return it->second;
}

std::vector<model::ExposureRecord> MemoryRepository::ListExposures(Transaction& t, const ExposureQuery& query) {
  std::vector<model::ExposureRecord> records;
  for (const auto& [_, record] : TX(t).Readable()) {
    if (model::MatchesQuery(record, query)) {
      records.push_back(record);
    }
  }

  // map order is by key already; stable sort keeps it as the tiebreaker
  std::stable_sort(records.begin(), records.end(), [](const model::ExposureRecord& a, const model::ExposureRecord& b) {
    return a.created_at_ms < b.created_at_ms;
  });

  if (query.limit && records.size() > *query.limit) {
    records.resize(*query.limit);
  }
  return records;
}

} // namespace keyserver::db::memory
