#include "internal/service/status_service.hpp"

#include <cassert>
#include <iostream>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace {

using namespace mirrorwatch;

constexpr uint64_t kHour = util::kMillisPerHour;

struct Fixture {
  std::shared_ptr<db::Repository>      repo = std::make_shared<db::memory::MemoryRepository>();
  std::unique_ptr<service::StatusService> service;
  uint64_t                             now_ms = util::ToUnixMillis(util::Now());

  Fixture() {
    auto config = config::ConfigLoader::LoadFromYamlString("");

    service::ServiceContext ctx;
    ctx.repository  = repo;
    ctx.scoring     = std::make_shared<scoring::ScoringEngine>(config);
    ctx.error_limit = 2;
    service         = std::make_unique<service::StatusService>(ctx);
  }

  int64_t AddInstance(const std::string& domain, bool enabled = true, bool bad = false, uint32_t missed = 0) {
    db::model::InstanceRecord record;
    record.domain        = domain;
    record.url           = "https://" + domain;
    record.country       = "FR";
    record.enabled       = enabled;
    record.is_bad_host   = bad;
    record.missed_passes = missed;
    auto tx              = repo->Begin();
    auto result          = repo->InsertInstance(*tx, record);
    assert(result);
    tx->Commit();
    return record.id;
  }

  void AddCheck(int64_t id, uint64_t at_ms, bool healthy, std::optional<int64_t> response_ms = std::nullopt) {
    db::model::HealthCheckRecord check;
    check.instance_id       = id;
    check.checked_at_ms     = at_ms;
    check.healthy           = healthy;
    check.response_time_ms  = response_ms;
    check.version           = "2024.1.1-abcdef1";
    check.version_url       = "https://github.com/zedeus/nitter/commit/abcdef1";
    check.is_upstream       = true;
    check.is_latest_version = true;
    auto tx                 = repo->Begin();
    auto result             = repo->InsertHealthCheck(*tx, check);
    assert(result);
    tx->Commit();
  }

  void AddStats(int64_t id, uint64_t at_ms, int64_t requests) {
    db::model::StatsSnapshotRecord snapshot;
    snapshot.instance_id     = id;
    snapshot.collected_at_ms = at_ms;
    snapshot.counters        = {{"requests_total", requests}, {"accounts_total", 10}};
    auto tx                  = repo->Begin();
    auto result              = repo->InsertStatsSnapshot(*tx, snapshot);
    assert(result);
    tx->Commit();
  }
};

template <typename Ex, typename Fn>
bool Throws(Fn&& fn) {
  try {
    fn();
  } catch (const Ex&) {
    return true;
  }
  return false;
}

void TestListInstancesRanksEnabledFleet() {
  Fixture f;
  auto    good    = f.AddInstance("good.example");
  auto    flaky   = f.AddInstance("flaky.example", true, false, 2);
  auto    bad     = f.AddInstance("bad.example", true, true);
  auto    retired = f.AddInstance("retired.example", false);

  for (int i = 1; i <= 4; ++i) {
    f.AddCheck(good, f.now_ms - i * kHour / 2, true, 100 * i);
    f.AddCheck(flaky, f.now_ms - i * kHour / 2, i % 2 == 0, 50);
    f.AddCheck(bad, f.now_ms - i * kHour / 2, true, 10);
    f.AddCheck(retired, f.now_ms - i * kHour / 2, true, 10);
  }

  v1::ListInstancesRequest req;
  auto                     resp = f.service->ListInstances(req);
  assert(resp.instances_size() == 3);
  assert(resp.instances(0).domain() == "good.example");
  assert(resp.instances(0).rank() == 1);
  assert(resp.instances(0).points() == 80);
  assert(resp.instances(0).healthy_now());
  assert(resp.instances(0).has_avg_response_ms());
  assert(resp.instances(0).commit_status() == v1::COMMIT_STATUS_CURRENT);
  assert(resp.instances(0).recent_checks_size() == 4);
  assert(!resp.instances(0).stale());

  assert(resp.instances(1).domain() == "flaky.example");
  assert(resp.instances(1).rank() == 2);
  assert(resp.instances(1).stale());
  assert(!resp.instances(1).healthy_now());

  assert(resp.instances(2).domain() == "bad.example");
  assert(resp.instances(2).rank() == 0);
  assert(resp.instances(2).is_bad_host());
  assert(resp.has_generated_at());

  req.set_include_disabled(true);
  auto all = f.service->ListInstances(req);
  assert(all.instances_size() == 4);
  assert(all.instances(3).domain() == "retired.example");
  assert(!all.instances(3).enabled());
  assert(all.instances(3).rank() == 0);
}

void TestGetInstance() {
  Fixture f;
  auto    a = f.AddInstance("a.example");
  f.AddInstance("b.example");
  f.AddCheck(a, f.now_ms - kHour, true, 120);

  {
    auto tx = f.repo->Begin();
    for (uint64_t i = 1; i <= 3; ++i) {
      db::model::ErrorRecord error;
      error.instance_id    = a;
      error.occurred_at_ms = f.now_ms - 10 * kHour + i;
      error.category       = v1::ERROR_CATEGORY_HTTP_STATUS;
      error.message        = "error " + std::to_string(i);
      error.http_status    = 500;
      auto result          = f.repo->InsertError(*tx, error);
      assert(result);
    }
    tx->Commit();
  }

  v1::GetInstanceRequest req;
  req.set_domain("HTTPS://A.example/");
  auto resp = f.service->GetInstance(req);
  assert(resp.instance().domain() == "a.example");
  assert(resp.instance().rank() == 1);
  assert(resp.instance().avg_response_ms() == 120);
  assert(resp.instance().version() == "2024.1.1-abcdef1");
  assert(resp.errors_size() == 2);
  assert(resp.errors(0).message() == "error 3");
  assert(resp.errors(0).http_status() == 500);

  req.set_domain("missing.example");
  assert(Throws<util::NotFound>([&] { f.service->GetInstance(req); }));
  req.set_domain("");
  assert(Throws<util::InvalidArgument>([&] { f.service->GetInstance(req); }));
}

void TestHealthHistoryBuckets() {
  Fixture        f;
  auto           a     = f.AddInstance("a.example");
  auto           b     = f.AddInstance("b.example");
  const uint64_t start = 1'000 * kHour;

  f.AddCheck(a, start + 10, true, 100);
  f.AddCheck(a, start + 20, true, 300);
  f.AddCheck(b, start + 30, false);
  f.AddCheck(b, start + 2 * kHour + 5, true);
  // outside the window
  f.AddCheck(a, start + 3 * kHour, true, 999);
  f.AddCheck(a, start - 1, true, 999);

  v1::HealthHistoryRequest req;
  *req.mutable_start()  = util::MillisToProto(start);
  *req.mutable_end()    = util::MillisToProto(start + 3 * kHour);
  *req.mutable_bucket() = util::ToProtoDuration(std::chrono::hours(1));

  auto fleet = f.service->QueryHealthHistory(req);
  assert(fleet.buckets_size() == 3);
  assert(util::ProtoToMillis(fleet.buckets(0).start()) == start);
  assert(fleet.buckets(0).healthy() == 2);
  assert(fleet.buckets(0).dead() == 1);
  assert(fleet.buckets(0).avg_response_ms() == 200.0);
  assert(fleet.buckets(1).healthy() == 0 && fleet.buckets(1).dead() == 0);
  assert(!fleet.buckets(1).has_avg_response_ms());
  assert(fleet.buckets(2).healthy() == 1);
  // healthy without a response time contributes no sample
  assert(!fleet.buckets(2).has_avg_response_ms());

  req.set_domain("b.example");
  auto one = f.service->QueryHealthHistory(req);
  assert(one.buckets(0).healthy() == 0);
  assert(one.buckets(0).dead() == 1);

  req.set_domain("nope.example");
  assert(Throws<util::NotFound>([&] { f.service->QueryHealthHistory(req); }));

  req.set_domain("");
  *req.mutable_end() = util::MillisToProto(start);
  assert(Throws<util::InvalidArgument>([&] { f.service->QueryHealthHistory(req); }));

  *req.mutable_end()    = util::MillisToProto(start + 3 * kHour);
  *req.mutable_bucket() = util::ToProtoDuration(std::chrono::milliseconds(1));
  assert(Throws<util::InvalidArgument>([&] { f.service->QueryHealthHistory(req); }));
}

void TestStatsSumsFleetPerTick() {
  Fixture        f;
  auto           a     = f.AddInstance("a.example");
  auto           b     = f.AddInstance("b.example");
  const uint64_t start = 2'000 * kHour;

  // two ticks in the first bucket, one in the third
  f.AddStats(a, start + 100, 10);
  f.AddStats(b, start + 100, 30);
  f.AddStats(a, start + 200, 20);
  f.AddStats(b, start + 200, 60);
  f.AddStats(a, start + 2 * kHour, 5);

  v1::StatsRequest req;
  *req.mutable_start()  = util::MillisToProto(start);
  *req.mutable_end()    = util::MillisToProto(start + 3 * kHour);
  *req.mutable_bucket() = util::ToProtoDuration(std::chrono::hours(1));

  auto fleet = f.service->QueryStats(req);
  assert(fleet.buckets_size() == 2);
  assert(util::ProtoToMillis(fleet.buckets(1).start()) == start + 2 * kHour);

  const v1::CounterSummary* requests = nullptr;
  for (const auto& counter : fleet.buckets(0).counters()) {
    if (counter.name() == "requests_total") requests = &counter;
  }
  assert(requests);
  assert(requests->min() == 40.0);
  assert(requests->max() == 80.0);
  assert(requests->avg() == 60.0);
  assert(requests->samples() == 2);

  req.set_domain("b.example");
  auto one = f.service->QueryStats(req);
  assert(one.buckets_size() == 1);
  for (const auto& counter : one.buckets(0).counters()) {
    if (counter.name() == "requests_total") {
      assert(counter.min() == 30.0 && counter.max() == 60.0 && counter.avg() == 45.0);
    }
  }
}

void TestGetUpstream() {
  Fixture f;
  auto    empty = f.service->GetUpstream({});
  assert(empty.commit().empty());

  auto tx     = f.repo->Begin();
  auto result = f.repo->SaveUpstreamVersion(*tx, {"abcdef1234", "master", 1234});
  assert(result);
  tx->Commit();

  auto info = f.service->GetUpstream({});
  assert(info.commit() == "abcdef1234");
  assert(info.branch() == "master");
  assert(util::ProtoToMillis(info.refreshed_at()) == 1234);
}

} // namespace

int main() {
  TestListInstancesRanksEnabledFleet();
  TestGetInstance();
  TestHealthHistoryBuckets();
  TestStatsSumsFleetPerTick();
  TestGetUpstream();

  std::cout << "status_service_test: pass\n";
  return 0;
}
