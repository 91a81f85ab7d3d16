#include "internal/retention/retention_service.hpp"

#include <cassert>
#include <cstdint>
#include <iostream>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/retention/stats_collector.hpp"
#include "internal/util/time.hpp"
#include "support/fake_http_client.hpp"

namespace {

using namespace mirrorwatch;
using mirrorwatch::testing::FakeHttpClient;
using mirrorwatch::testing::Respond;

int64_t AddInstance(db::Repository& repo, const std::string& domain, bool enabled = true) {
  db::model::InstanceRecord record;
  record.domain  = domain;
  record.url     = "https://" + domain;
  record.enabled = enabled;
  auto tx        = repo.Begin();
  auto result    = repo.InsertInstance(*tx, record);
  assert(result);
  tx->Commit();
  return record.id;
}

void TestCleanupTrimsErrorLogs() {
  auto repo = std::make_shared<db::memory::MemoryRepository>();
  auto a    = AddInstance(*repo, "a.example");
  auto b    = AddInstance(*repo, "b.example");

  {
    auto tx = repo->Begin();
    for (uint64_t i = 1; i <= 30; ++i) {
      db::model::ErrorRecord error;
      error.instance_id    = a;
      error.occurred_at_ms = i * 1000;
      error.category       = v1::ERROR_CATEGORY_HTTP_STATUS;
      error.message        = "error " + std::to_string(i);
      auto result          = repo->InsertError(*tx, error);
      assert(result);
      if (i <= 3) {
        error.instance_id = b;
        auto other        = repo->InsertError(*tx, error);
        assert(other);
      }
    }
    tx->Commit();
  }

  auto config = config::ConfigLoader::LoadFromYamlString("").retention();
  retention::RetentionService service(config, repo);

  auto report = service.Cleanup();
  assert(report.instances_trimmed == 1);
  assert(!report.health_checks_pruned);

  auto tx     = repo->Begin();
  auto errors = repo->ListErrors(*tx, a, 100);
  assert(errors.size() == 20);
  assert(errors.front().message == "error 30");
  assert(errors.back().message == "error 11");
  assert(repo->CountErrors(*tx, b) == 3);
  tx->Commit();

  // nothing left to trim
  assert(service.Cleanup().instances_trimmed == 0);
}

void TestCleanupPrunesOldHealthChecks() {
  auto       repo   = std::make_shared<db::memory::MemoryRepository>();
  auto       a      = AddInstance(*repo, "a.example");
  const auto now_ms = util::ToUnixMillis(util::Now());

  {
    auto tx = repo->Begin();
    for (uint64_t days : {200u, 150u, 100u, 1u}) {
      db::model::HealthCheckRecord check;
      check.instance_id   = a;
      check.checked_at_ms = now_ms - days * util::kMillisPerDay;
      check.healthy       = true;
      auto result         = repo->InsertHealthCheck(*tx, check);
      assert(result);
    }
    tx->Commit();
  }

  // horizon disabled: everything stays
  auto keep_all = config::ConfigLoader::LoadFromYamlString("").retention();
  retention::RetentionService forever(keep_all, repo);
  assert(!forever.Cleanup().health_checks_pruned);

  auto config = config::ConfigLoader::LoadFromYamlString("retention:\n  health_check_horizon: \"11232000s\"\n").retention();
  retention::RetentionService service(config, repo);
  assert(service.Cleanup().health_checks_pruned);

  auto tx     = repo->Begin();
  auto checks = repo->RecentHealthChecks(*tx, a, 10);
  tx->Commit();
  assert(checks.size() == 2);
  assert(checks.back().checked_at_ms == now_ms - 100 * util::kMillisPerDay);
}

void TestParseHealthReport() {
  auto accounts = retention::ParseHealthReport(R"({"accounts":{"total":12,"limited":3,"oldest":"x"},"requests":{"total":4567,"apis":{}}})");
  const auto& counters = std::get<std::map<std::string, int64_t>>(accounts);
  assert(counters.at(retention::kAccountsTotal) == 12);
  assert(counters.at(retention::kAccountsLimited) == 3);
  assert(counters.at(retention::kRequestsTotal) == 4567);

  auto sessions = retention::ParseHealthReport(R"({"sessions":{"total":5},"requests":{"total":0}})");
  const auto& legacy = std::get<std::map<std::string, int64_t>>(sessions);
  assert(legacy.at(retention::kAccountsTotal) == 5);
  assert(legacy.at(retention::kAccountsLimited) == 0);

  assert(std::holds_alternative<retention::StatsParseError>(retention::ParseHealthReport("<html>not json</html>")));
  assert(std::holds_alternative<retention::StatsParseError>(retention::ParseHealthReport(R"({"requests":{"total":1}})")));
  assert(std::holds_alternative<retention::StatsParseError>(retention::ParseHealthReport(R"({"accounts":{"total":1}})")));
}

void TestCollectStoresOneSnapshotPerRespondingInstance() {
  auto repo   = std::make_shared<db::memory::MemoryRepository>();
  auto client = std::make_shared<FakeHttpClient>();
  auto config = config::ConfigLoader::LoadFromYamlString(R"(instance_overrides:
  - domain: "d.example"
    stats_path: "/stats"
    stats_query: "key=1"
    bearer_token: "tok"
)");

  auto a = AddInstance(*repo, "a.example");
  AddInstance(*repo, "b.example");
  AddInstance(*repo, "c.example");
  auto d = AddInstance(*repo, "d.example");
  AddInstance(*repo, "e.example", false);

  client->Route("https://a.example/.health", Respond(200, R"({"accounts":{"total":10,"limited":1},"requests":{"total":100}})"));
  client->Route("https://b.example/.health", Respond(404, "not found"));
  client->Route("https://c.example/.health", Respond(500, "error"));
  client->Route("https://d.example/stats?key=1", Respond(200, R"({"sessions":{"total":3,"limited":0},"requests":{"total":7}})"));
  client->Route("https://e.example/.health", Respond(200, R"({"accounts":{"total":1},"requests":{"total":1}})"));

  auto pool = std::make_shared<scheduler::WorkerPool>("stats", 2);
  retention::StatsCollector collector(config, client, repo, pool);

  auto report = collector.Collect();
  assert(report.polled == 4);
  assert(report.stored == 2);
  assert(report.unavailable == 1);
  assert(report.failed == 1);
  assert(client->CountRequests("https://e.example/.health") == 0);

  for (const auto& request : client->Requests()) {
    const bool has_auth = !request.headers.empty() && request.headers.front().first == "Authorization";
    assert(has_auth == (request.url == "https://d.example/stats?key=1"));
    if (has_auth) assert(request.headers.front().second == "Bearer tok");
  }

  auto tx        = repo->Begin();
  auto snapshots = repo->ListStatsSnapshots(*tx, {0, UINT64_MAX, std::nullopt});
  auto last      = repo->LastStatsAt(*tx);
  tx->Commit();

  assert(snapshots.size() == 2);
  assert(snapshots[0].collected_at_ms == snapshots[1].collected_at_ms);
  assert(last == snapshots[0].collected_at_ms);
  for (const auto& snapshot : snapshots) {
    if (snapshot.instance_id == a) assert(snapshot.counters.at(retention::kRequestsTotal) == 100);
    if (snapshot.instance_id == d) assert(snapshot.counters.at(retention::kAccountsTotal) == 3);
  }

  pool->Shutdown();
}

void TestCollectAfterPoolShutdownReturns() {
  auto repo   = std::make_shared<db::memory::MemoryRepository>();
  auto config = config::ConfigLoader::LoadFromYamlString("");
  AddInstance(*repo, "a.example");

  auto pool = std::make_shared<scheduler::WorkerPool>("stats", 1);
  pool->Shutdown();

  retention::StatsCollector collector(config, std::make_shared<FakeHttpClient>(), repo, pool);
  auto                      report = collector.Collect();
  assert(report.polled == 0);
  assert(report.stored == 0);
}

} // namespace

int main() {
  TestCleanupTrimsErrorLogs();
  TestCleanupPrunesOldHealthChecks();
  TestParseHealthReport();
  TestCollectStoresOneSnapshotPerRespondingInstance();
  TestCollectAfterPoolShutdownReturns();

  std::cout << "retention_test: pass\n";
  return 0;
}
