#include <cassert>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include "internal/db/api/repository.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/db/model/exposure_record.hpp"

#if KEYSERVER_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#include "internal/db/sqlite/sqlite_schema.hpp"
#endif

namespace {

using keyserver::db::ExposureQuery;
using keyserver::db::Repository;
using keyserver::db::memory::MemoryRepository;
using keyserver::db::model::ExposureRecord;

std::int64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
  bool                                              supports_parallel_transactions = true;
};

// Raw 16 byte key; tag keeps keys of different checks apart.
std::string RawKey(char tag, int n) {
  std::string key(16, '\0');
  key[0]  = tag;
  key[15] = static_cast<char>(n);
  return key;
}

ExposureRecord Record(const std::string& key, std::vector<std::string> regions, std::int64_t created_at_ms) {
  return ExposureRecord{.exposure_key      = key,
                        .transmission_risk = 3,
                        .app_package_name  = "com.example.app",
                        .regions           = std::move(regions),
                        .interval_number   = 2704032,
                        .interval_count    = 144,
                        .created_at_ms     = created_at_ms};
}

void VerifyInsertAndGet(Repository& repo) {
  auto tx = repo.Begin();

  ExposureRecord federated = Record(RawKey('g', 2), {"CA"}, 1000);
  federated.local_provenance = false;
  federated.sync_id          = 42;

  assert(repo.InsertExposures(*tx, {Record(RawKey('g', 1), {"US", "CA"}, 1000), federated}));

  auto read = repo.GetExposure(*tx, RawKey('g', 1));
  assert(read.has_value());
  assert(read->exposure_key == RawKey('g', 1));
  assert(read->transmission_risk == 3);
  assert(read->app_package_name == "com.example.app");
  assert((read->regions == std::vector<std::string>{"US", "CA"}));
  assert(read->interval_number == 2704032);
  assert(read->interval_count == 144);
  assert(read->created_at_ms == 1000);
  assert(read->local_provenance);
  assert(!read->sync_id.has_value());

  auto remote = repo.GetExposure(*tx, RawKey('g', 2));
  assert(remote.has_value());
  assert(!remote->local_provenance);
  assert(remote->sync_id == 42);

  assert(!repo.GetExposure(*tx, RawKey('g', 3)).has_value());
  tx->Commit();
  assert(tx->IsCommitted());

  bool threw = false;
  try {
    tx->Commit();
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw && "second commit must fail");
}

void VerifyDuplicateKeyIsRejected(Repository& repo) {
  {
    auto tx = repo.Begin();
    assert(repo.InsertExposures(*tx, {Record(RawKey('d', 1), {"US"}, 2000)}));
    tx->Commit();
  }

  auto tx     = repo.Begin();
  auto result = repo.InsertExposures(*tx, {Record(RawKey('d', 2), {"US"}, 2000), Record(RawKey('d', 1), {"US"}, 2000)});
  assert(!result);
  assert(result.IsDuplicate());
  tx->Rollback();
  assert(tx->IsFinished());
  assert(!tx->IsCommitted());

  // Nothing of the failed batch is visible.
  auto check_tx = repo.Begin();
  assert(!repo.GetExposure(*check_tx, RawKey('d', 2)).has_value());
  check_tx->Commit();
}

void VerifyRollbackBehavior(Repository& repo) {
  {
    auto tx = repo.Begin();
    assert(repo.InsertExposures(*tx, {Record(RawKey('r', 1), {"US"}, 3000)}));
    tx->Rollback();
  }
  {
    // Destructor rolls back an unfinished transaction.
    auto tx = repo.Begin();
    assert(repo.InsertExposures(*tx, {Record(RawKey('r', 2), {"US"}, 3000)}));
  }

  auto check_tx = repo.Begin();
  assert(!repo.GetExposure(*check_tx, RawKey('r', 1)).has_value());
  assert(!repo.GetExposure(*check_tx, RawKey('r', 2)).has_value());
  check_tx->Commit();
}

void VerifyListFilters(Repository& repo) {
  {
    auto tx = repo.Begin();
    ExposureRecord federated = Record(RawKey('l', 4), {"US"}, 10'000);
    federated.local_provenance = false;
    assert(repo.InsertExposures(*tx, {Record(RawKey('l', 3), {"US"}, 30'000), Record(RawKey('l', 1), {"US", "CA"}, 10'000),
                                      Record(RawKey('l', 2), {"MX"}, 20'000), federated}));
    tx->Commit();
  }

  auto tx = repo.Begin();

  const auto all = repo.ListExposures(*tx, ExposureQuery{.created_after_ms = 10'000, .created_before_ms = 40'000});
  assert(all.size() == 4);
  assert(all[0].exposure_key == RawKey('l', 1));
  assert(all[1].exposure_key == RawKey('l', 4));
  assert(all[2].exposure_key == RawKey('l', 2));
  assert(all[3].exposure_key == RawKey('l', 3));

  const auto window = repo.ListExposures(*tx, ExposureQuery{.created_after_ms = 10'001, .created_before_ms = 30'000});
  assert(window.size() == 1);
  assert(window[0].exposure_key == RawKey('l', 2));

  const auto us_local = repo.ListExposures(
      *tx, ExposureQuery{.created_after_ms = 10'000, .created_before_ms = 40'000, .region = "US", .only_local_provenance = true});
  assert(us_local.size() == 2);
  assert(us_local[0].exposure_key == RawKey('l', 1));
  assert(us_local[1].exposure_key == RawKey('l', 3));

  const auto limited = repo.ListExposures(*tx, ExposureQuery{.created_after_ms = 10'000, .created_before_ms = 40'000, .limit = 2});
  assert(limited.size() == 2);
  assert(limited[1].exposure_key == RawKey('l', 4));

  tx->Commit();
}

void VerifyRegionsAreStoredVerbatim(Repository& repo) {
  {
    auto tx = repo.Begin();
    assert(repo.InsertExposures(*tx, {Record(RawKey('r', 1), {"US,CA", "", "US"}, 50'000), Record(RawKey('r', 2), {"CA"}, 50'000),
                                      Record(RawKey('r', 3), {}, 50'000)}));
    tx->Commit();
  }

  auto tx = repo.Begin();

  auto read = repo.GetExposure(*tx, RawKey('r', 1));
  assert(read.has_value());
  assert((read->regions == std::vector<std::string>{"US,CA", "", "US"}));
  assert(repo.GetExposure(*tx, RawKey('r', 3))->regions.empty());

  const ExposureQuery window{.created_after_ms = 50'000, .created_before_ms = 50'001};

  auto joined = window;
  joined.region = "US,CA";
  const auto by_joined = repo.ListExposures(*tx, joined);
  assert(by_joined.size() == 1);
  assert(by_joined[0].exposure_key == RawKey('r', 1));

  auto ca = window;
  ca.region = "CA";
  const auto by_ca = repo.ListExposures(*tx, ca);
  assert(by_ca.size() == 1);
  assert(by_ca[0].exposure_key == RawKey('r', 2));

  auto empty = window;
  empty.region = "";
  assert(repo.ListExposures(*tx, empty).size() == 1);

  const auto all = repo.ListExposures(*tx, window);
  assert(all.size() == 3);
  assert((all[0].regions == std::vector<std::string>{"US,CA", "", "US"}));

  tx->Rollback();
}

void VerifyConcurrentTransactions(Repository& repo, bool supports_parallel_transactions) {
  auto tx1 = repo.Begin();
  if (!supports_parallel_transactions) {
    bool threw = false;
    try {
      auto tx2 = repo.Begin();
      (void)tx2;
    } catch (const std::exception&) {
      threw = true;
    }
    assert(threw);
    tx1->Rollback();
    return;
  }

  auto tx2 = repo.Begin();
  assert(repo.InsertExposures(*tx1, {Record(RawKey('c', 1), {"US"}, 5000)}));
  assert(repo.InsertExposures(*tx2, {Record(RawKey('c', 2), {"US"}, 5000)}));
  tx1->Commit();

  // tx2 started from a snapshot that no longer matches.
  bool threw = false;
  try {
    tx2->Commit();
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);

  auto verify_tx = repo.Begin();
  assert(repo.GetExposure(*verify_tx, RawKey('c', 1)).has_value());
  assert(!repo.GetExposure(*verify_tx, RawKey('c', 2)).has_value());
  verify_tx->Commit();
}

void VerifyRestartDurability(BackendFactory& backend) {
  if (!backend.supports_restart()) {
    return;
  }

  auto repo = backend.make_repository();
  {
    auto tx = repo->Begin();
    assert(repo->InsertExposures(*tx, {Record(RawKey('p', 1), {"US", "CA"}, NowMs())}));
    tx->Commit();
  }

  backend.restart(repo);

  auto tx = repo->Begin();
  auto e  = repo->GetExposure(*tx, RawKey('p', 1));
  assert(e.has_value());
  assert((e->regions == std::vector<std::string>{"US", "CA"}));
  tx->Commit();
  backend.cleanup();
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name                           = "memory",
      .make_repository                = []() { return std::make_shared<MemoryRepository>(); },
      .supports_restart               = []() { return false; },
      .restart                        = [](std::shared_ptr<Repository>&) {},
      .cleanup                        = []() {},
      .supports_parallel_transactions = true,
  };
}

#if KEYSERVER_DB_SQLITE
BackendFactory MakeSqliteFactory() {
  auto db_path   = (std::filesystem::temp_directory_path() / ("keyserver_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();
  auto make_repo = [db_path]() {
    auto db = std::make_shared<keyserver::db::sqlite::SqliteDB>(db_path);
    keyserver::db::sqlite::BootstrapSchema(*db);
    return std::make_shared<keyserver::db::sqlite::SqliteRepository>(std::move(db));
  };

  return BackendFactory{
      .name                           = "sqlite",
      .make_repository                = make_repo,
      .supports_restart               = []() { return true; },
      .restart                        = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup                        = [db_path]() {
        std::filesystem::remove(db_path);
        std::filesystem::remove(db_path + "-wal");
        std::filesystem::remove(db_path + "-shm");
      },
      .supports_parallel_transactions = false,
  };
}
#endif

void RunBackendSuite(BackendFactory& backend) {
  std::cout << "running backend suite: " << backend.name << "\n";
  auto repo = backend.make_repository();

  VerifyInsertAndGet(*repo);
  VerifyDuplicateKeyIsRejected(*repo);
  VerifyRollbackBehavior(*repo);
  VerifyListFilters(*repo);
  VerifyRegionsAreStoredVerbatim(*repo);
  VerifyConcurrentTransactions(*repo, backend.supports_parallel_transactions);

  repo.reset();
  VerifyRestartDurability(backend);

  backend.cleanup();
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());

#if KEYSERVER_DB_SQLITE
  backends.push_back(MakeSqliteFactory());
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "keyserver_integration_repository_parity: pass\n";
  return 0;
}
