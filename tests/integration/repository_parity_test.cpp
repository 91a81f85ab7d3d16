#include <cassert>
#include <chrono>
#include <cstdlib>
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

#if MIRRORWATCH_DB_SQLITE
#include "internal/db/sql/schema.hpp"
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif

#if MIRRORWATCH_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace {

using mirrorwatch::db::Repository;
using mirrorwatch::db::TimeRange;
using mirrorwatch::db::memory::MemoryRepository;
using mirrorwatch::db::model::ErrorRecord;
using mirrorwatch::db::model::HealthCheckRecord;
using mirrorwatch::db::model::InstanceRecord;
using mirrorwatch::db::model::StatsSnapshotRecord;
using mirrorwatch::db::model::UpstreamVersionRecord;

uint64_t NowMs() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

struct BackendFactory {
  std::string                                       name;
  std::function<std::shared_ptr<Repository>()>      make_repository;
  std::function<bool()>                             supports_restart;
  std::function<void(std::shared_ptr<Repository>&)> restart;
  std::function<void()>                             cleanup;
};

InstanceRecord MakeInstance(const std::string& domain) {
  InstanceRecord record;
  record.domain        = domain;
  record.url           = "https://" + domain;
  record.country       = "DE";
  record.enabled       = true;
  record.created_at_ms = NowMs();
  record.updated_at_ms = record.created_at_ms;
  return record;
}

HealthCheckRecord MakeCheck(int64_t instance_id, uint64_t at_ms, bool healthy) {
  HealthCheckRecord check;
  check.instance_id   = instance_id;
  check.checked_at_ms = at_ms;
  check.healthy       = healthy;
  if (healthy) {
    check.response_time_ms  = 120;
    check.http_status       = 200;
    check.version           = "2024.01.01-abcdef1";
    check.version_url       = "https://github.com/zedeus/nitter/commit/abcdef1";
    check.is_upstream       = true;
    check.is_latest_version = true;
    check.rss               = true;
    check.connectivity      = mirrorwatch::v1::CONNECTIVITY_ALL;
  }
  return check;
}

void VerifyInstanceLifecycle(Repository& repo, const std::string& domain) {
  int64_t id = 0;
  {
    auto tx     = repo.Begin();
    auto record = MakeInstance(domain);
    auto result = repo.InsertInstance(*tx, record);
    assert(result);
    assert(record.id > 0);
    id = record.id;

    // domain is unique
    auto duplicate = MakeInstance(domain);
    const auto dup = repo.InsertInstance(*tx, duplicate);
    assert(!dup);
    tx->Commit();
  }

  {
    auto tx    = repo.Begin();
    auto found = repo.GetInstanceByDomain(*tx, domain);
    assert(found.has_value());
    assert(found->id == id);
    assert(found->country == "DE");
    assert(found->enabled);

    found->enabled       = false;
    found->missed_passes = 3;
    found->is_bad_host   = true;
    const auto updated   = repo.UpdateInstance(*tx, *found);
    assert(updated);
    tx->Commit();
  }

  {
    auto tx   = repo.Begin();
    auto byid = repo.GetInstance(*tx, id);
    assert(byid.has_value());
    assert(!byid->enabled);
    assert(byid->missed_passes == 3);
    assert(byid->is_bad_host);

    bool listed_all = false;
    for (const auto& i : repo.ListInstances(*tx, false)) listed_all |= i.id == id;
    assert(listed_all);
    for (const auto& i : repo.ListInstances(*tx, true)) assert(i.id != id);

    auto missing = MakeInstance(domain + ".missing");
    missing.id   = 987654321;
    const auto not_found = repo.UpdateInstance(*tx, missing);
    assert(!not_found);
    tx->Commit();
  }
}

void VerifyHealthChecks(Repository& repo, const std::string& domain, uint64_t base_ms) {
  auto tx       = repo.Begin();
  auto instance = MakeInstance(domain);
  const auto inserted = repo.InsertInstance(*tx, instance);
  assert(inserted);

  // out of order on purpose
  assert(repo.InsertHealthCheck(*tx, MakeCheck(instance.id, base_ms + 2000, false)));
  assert(repo.InsertHealthCheck(*tx, MakeCheck(instance.id, base_ms, true)));
  assert(repo.InsertHealthCheck(*tx, MakeCheck(instance.id, base_ms + 1000, true)));
  tx->Commit();

  auto rtx = repo.Begin();

  TimeRange range{.from_ms = base_ms, .to_ms = base_ms + 2000, .instance_id = instance.id};
  auto      oldest_first = repo.ListHealthChecks(*rtx, range);
  assert(oldest_first.size() == 2); // half-open range
  assert(oldest_first[0].checked_at_ms == base_ms);
  assert(oldest_first[1].checked_at_ms == base_ms + 1000);
  assert(oldest_first[0].response_time_ms == 120);
  assert(oldest_first[0].version == "2024.01.01-abcdef1");
  assert(oldest_first[0].connectivity == mirrorwatch::v1::CONNECTIVITY_ALL);

  auto recent = repo.RecentHealthChecks(*rtx, instance.id, 2);
  assert(recent.size() == 2);
  assert(recent[0].checked_at_ms == base_ms + 2000);
  assert(!recent[0].healthy);
  assert(!recent[0].response_time_ms.has_value());
  assert(!recent[0].version.has_value());
  assert(recent[1].checked_at_ms == base_ms + 1000);

  bool saw_latest = false;
  for (const auto& latest : repo.LatestHealthChecks(*rtx)) {
    if (latest.instance_id != instance.id) continue;
    saw_latest = true;
    assert(latest.checked_at_ms == base_ms + 2000);
  }
  assert(saw_latest);

  auto counts = repo.CountHealthChecks(*rtx, TimeRange{.from_ms = base_ms, .to_ms = base_ms + 3000, .instance_id = instance.id});
  assert(counts.total == 3);
  assert(counts.healthy == 2);

  auto last_healthy = repo.LastHealthyAt(*rtx, instance.id);
  assert(last_healthy.has_value());
  assert(*last_healthy == base_ms + 1000);

  auto last_check = repo.LastHealthCheckAt(*rtx);
  assert(last_check.has_value());
  assert(*last_check >= base_ms + 2000);
  rtx->Commit();

  auto dtx = repo.Begin();
  assert(repo.DeleteHealthChecksBefore(*dtx, base_ms + 1000));
  dtx->Commit();

  auto vtx       = repo.Begin();
  auto remaining = repo.ListHealthChecks(*vtx, TimeRange{.from_ms = 0, .to_ms = base_ms + 3000, .instance_id = instance.id});
  assert(remaining.size() == 2);
  assert(remaining[0].checked_at_ms == base_ms + 1000);
  vtx->Commit();
}

void VerifyErrorLog(Repository& repo, const std::string& domain, uint64_t base_ms) {
  auto tx       = repo.Begin();
  auto instance = MakeInstance(domain);
  const auto inserted = repo.InsertInstance(*tx, instance);
  assert(inserted);

  for (int i = 0; i < 5; ++i) {
    ErrorRecord error;
    error.instance_id    = instance.id;
    error.occurred_at_ms = base_ms + static_cast<uint64_t>(i) * 100;
    error.category       = i % 2 == 0 ? mirrorwatch::v1::ERROR_CATEGORY_HTTP_STATUS : mirrorwatch::v1::ERROR_CATEGORY_TRANSIENT_NETWORK;
    error.message        = "failure " + std::to_string(i);
    if (i % 2 == 0) {
      error.http_status = 500;
      error.http_body   = "<html>oops</html>";
    }
    assert(repo.InsertError(*tx, error));
  }
  assert(repo.CountErrors(*tx, instance.id) == 5);
  assert(repo.TrimErrors(*tx, instance.id, 3));
  tx->Commit();

  auto rtx    = repo.Begin();
  auto errors = repo.ListErrors(*rtx, instance.id, 10);
  assert(errors.size() == 3);
  assert(errors[0].message == "failure 4"); // newest first
  assert(errors[0].http_status == 500);
  assert(errors[0].http_body == "<html>oops</html>");
  assert(errors[1].category == mirrorwatch::v1::ERROR_CATEGORY_TRANSIENT_NETWORK);
  assert(!errors[1].http_status.has_value());
  assert(errors[2].message == "failure 2");
  assert(repo.ListErrors(*rtx, instance.id, 1).size() == 1);
  rtx->Commit();
}

void VerifyStatsAndUpstream(Repository& repo, const std::string& domain, uint64_t base_ms) {
  auto tx       = repo.Begin();
  auto instance = MakeInstance(domain);
  const auto inserted = repo.InsertInstance(*tx, instance);
  assert(inserted);

  StatsSnapshotRecord first{.instance_id = instance.id, .collected_at_ms = base_ms, .counters = {{"accounts_total", 10}, {"requests_total", 400}}};
  StatsSnapshotRecord second{.instance_id = instance.id, .collected_at_ms = base_ms + 500, .counters = {{"accounts_total", 12}}};
  assert(repo.InsertStatsSnapshot(*tx, second));
  assert(repo.InsertStatsSnapshot(*tx, first));

  UpstreamVersionRecord upstream{.commit = "0123456789abcdef", .branch = "master", .refreshed_at_ms = base_ms};
  assert(repo.SaveUpstreamVersion(*tx, upstream));
  upstream.commit = "fedcba9876543210";
  assert(repo.SaveUpstreamVersion(*tx, upstream)); // single row, replaced
  tx->Commit();

  auto rtx       = repo.Begin();
  auto snapshots = repo.ListStatsSnapshots(*rtx, TimeRange{.from_ms = base_ms, .to_ms = base_ms + 1000, .instance_id = instance.id});
  assert(snapshots.size() == 2);
  assert(snapshots[0].collected_at_ms == base_ms);
  assert(snapshots[0].counters.size() == 2);
  assert(snapshots[0].counters.at("requests_total") == 400);
  assert(snapshots[1].counters.at("accounts_total") == 12);

  auto last_stats = repo.LastStatsAt(*rtx);
  assert(last_stats.has_value());
  assert(*last_stats >= base_ms + 500);

  auto stored = repo.GetUpstreamVersion(*rtx);
  assert(stored.has_value());
  assert(stored->commit == "fedcba9876543210");
  assert(stored->branch == "master");
  rtx->Commit();
}

void VerifyRollbackOnDestruction(Repository& repo, const std::string& domain) {
  {
    auto tx     = repo.Begin();
    auto record = MakeInstance(domain);
    const auto inserted = repo.InsertInstance(*tx, record);
    assert(inserted);
    // no commit
  }
  {
    auto tx = repo.Begin();
    auto record = MakeInstance(domain + ".explicit");
    const auto inserted = repo.InsertInstance(*tx, record);
    assert(inserted);
    tx->Rollback();
  }

  auto tx = repo.Begin();
  assert(!repo.GetInstanceByDomain(*tx, domain).has_value());
  assert(!repo.GetInstanceByDomain(*tx, domain + ".explicit").has_value());
  tx->Commit();
}

void VerifyRestartDurability(BackendFactory& backend, const std::string& domain, uint64_t base_ms) {
  if (!backend.supports_restart()) {
    return;
  }

  auto    repo = backend.make_repository();
  int64_t id   = 0;
  {
    auto tx       = repo->Begin();
    auto instance = MakeInstance(domain);
    const auto inserted = repo->InsertInstance(*tx, instance);
    assert(inserted);
    id = instance.id;
    assert(repo->InsertHealthCheck(*tx, MakeCheck(id, base_ms, true)));
    assert(repo->SaveUpstreamVersion(*tx, UpstreamVersionRecord{.commit = "abc1234", .branch = "master", .refreshed_at_ms = base_ms}));
    tx->Commit();
  }

  backend.restart(repo);

  auto tx       = repo->Begin();
  auto instance = repo->GetInstanceByDomain(*tx, domain);
  assert(instance.has_value());
  assert(instance->id == id);

  auto checks = repo->RecentHealthChecks(*tx, id, 5);
  assert(checks.size() == 1);
  assert(checks[0].healthy);

  auto upstream = repo->GetUpstreamVersion(*tx);
  assert(upstream.has_value());
  assert(upstream->commit == "abc1234");
  tx->Commit();
}

BackendFactory MakeMemoryFactory() {
  return BackendFactory{
      .name             = "memory",
      .make_repository  = []() { return std::make_shared<MemoryRepository>(); },
      .supports_restart = []() { return false; },
      .restart          = [](std::shared_ptr<Repository>&) {},
      .cleanup          = []() {},
  };
}

#if MIRRORWATCH_DB_SQLITE
void VerifySqliteSchemaStamp() {
  const auto path = (std::filesystem::temp_directory_path() / ("mirrorwatch_schema_stamp_" + std::to_string(NowMs()) + ".db")).string();
  {
    mirrorwatch::db::sqlite::SqliteDB db(path);
    assert(db.ApplySchema() == 0);
    assert(db.ApplySchema() == mirrorwatch::db::sql::kSchemaVersion);
    db.Exec("PRAGMA user_version=" + std::to_string(mirrorwatch::db::sql::kSchemaVersion + 1) + ";");
  }
  {
    mirrorwatch::db::sqlite::SqliteDB db(path);
    bool refused = false;
    try {
      db.ApplySchema();
    } catch (const std::runtime_error&) {
      refused = true;
    }
    assert(refused);
  }
  std::filesystem::remove(path);
  std::filesystem::remove(path + "-wal");
  std::filesystem::remove(path + "-shm");
}

BackendFactory MakeSqliteFactory() {
  auto db_path = (std::filesystem::temp_directory_path() / ("mirrorwatch_integration_sqlite_" + std::to_string(NowMs()) + ".db")).string();

  auto make_repo = [db_path]() -> std::shared_ptr<Repository> {
    auto db = std::make_shared<mirrorwatch::db::sqlite::SqliteDB>(db_path);
    db->ApplySchema();
    return std::make_shared<mirrorwatch::db::sqlite::SqliteRepository>(db);
  };

  return BackendFactory{
      .name             = "sqlite",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup          = [db_path]() {
        std::filesystem::remove(db_path);
        std::filesystem::remove(db_path + "-wal");
        std::filesystem::remove(db_path + "-shm");
      },
  };
}
#endif

#if MIRRORWATCH_DB_POSTGRES
BackendFactory MakePostgresFactory() {
  const char* uri = std::getenv("MIRRORWATCH_TEST_POSTGRES_URI");
  if (uri == nullptr || std::string(uri).empty()) {
    throw std::runtime_error("MIRRORWATCH_TEST_POSTGRES_URI not set");
  }
  const std::string conninfo(uri);

  auto make_repo = [conninfo]() -> std::shared_ptr<Repository> {
    auto pool = std::make_shared<mirrorwatch::db::postgres::PgPool>(conninfo);
    pool->ApplySchema();
    return std::make_shared<mirrorwatch::db::postgres::PgRepository>(pool);
  };

  return BackendFactory{
      .name             = "postgres",
      .make_repository  = make_repo,
      .supports_restart = []() { return true; },
      .restart          = [make_repo](std::shared_ptr<Repository>& repo) { repo = make_repo(); },
      .cleanup          = []() {},
  };
}
#endif

void RunBackendSuite(BackendFactory& backend) {
  // Unique per run so a persistent postgres database can be reused.
  const auto base_ms = NowMs();
  const auto suffix  = std::to_string(base_ms) + "." + backend.name + ".example";

  auto repo = backend.make_repository();
  VerifyInstanceLifecycle(*repo, "lifecycle-" + suffix);
  VerifyHealthChecks(*repo, "checks-" + suffix, base_ms);
  VerifyErrorLog(*repo, "errors-" + suffix, base_ms);
  VerifyStatsAndUpstream(*repo, "stats-" + suffix, base_ms);
  VerifyRollbackOnDestruction(*repo, "rollback-" + suffix);
  repo.reset();

  VerifyRestartDurability(backend, "restart-" + suffix, base_ms);
  backend.cleanup();

  std::cout << "repository_parity_test[" << backend.name << "]: pass\n";
}

} // namespace

int main() {
  std::vector<BackendFactory> backends;
  backends.push_back(MakeMemoryFactory());

#if MIRRORWATCH_DB_SQLITE
  VerifySqliteSchemaStamp();
  backends.push_back(MakeSqliteFactory());
#endif

#if MIRRORWATCH_DB_POSTGRES
  if (const char* uri = std::getenv("MIRRORWATCH_TEST_POSTGRES_URI"); uri != nullptr && *uri != '\0') {
    backends.push_back(MakePostgresFactory());
  } else {
    std::cout << "repository_parity_test[postgres]: skipped (MIRRORWATCH_TEST_POSTGRES_URI unset)\n";
  }
#endif

  for (auto& backend : backends) {
    RunBackendSuite(backend);
  }

  std::cout << "repository_parity_test: pass\n";
  return 0;
}
