#include "internal/scheduler/probe_scheduler.hpp"

#include <atomic>
#include <cassert>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/db/memory/memory_repository.hpp"
#include "support/fake_http_client.hpp"

namespace {

using namespace mirrorwatch;
using namespace std::chrono_literals;
using mirrorwatch::testing::FakeConnectivityChecker;
using mirrorwatch::testing::FakeHttpClient;
using mirrorwatch::testing::Respond;

std::string ProfilePage() {
  std::string page = "<div class=\"profile-card-username\">@jack</div><div class=\"timeline\">";
  for (int i = 0; i < 6; ++i) page += "<div class=\"timeline-item\"></div>";
  return page + "</div>";
}

template <typename Pred>
bool WaitFor(Pred pred, std::chrono::milliseconds timeout = 5000ms) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (!pred()) {
    if (std::chrono::steady_clock::now() > deadline) return false;
    std::this_thread::sleep_for(2ms);
  }
  return true;
}

struct Fixture {
  runtime::config::RuntimeConfig              config;
  std::shared_ptr<FakeHttpClient>             client = std::make_shared<FakeHttpClient>();
  std::shared_ptr<db::Repository>             repo   = std::make_shared<db::memory::MemoryRepository>();
  std::shared_ptr<scheduler::WorkerPool>      pool;
  std::unique_ptr<scheduler::ProbeScheduler>  scheduler;

  explicit Fixture(const std::string& yaml) {
    config      = config::ConfigLoader::LoadFromYamlString(yaml);
    auto oracle = std::make_shared<upstream::VersionOracle>(config.upstream(), client, repo, 1000ms);
    auto prober = std::make_shared<probe::HealthProber>(config, client, std::make_shared<FakeConnectivityChecker>(), oracle);
    pool        = std::make_shared<scheduler::WorkerPool>("probe", config.scanner().workers());
    scheduler   = std::make_unique<scheduler::ProbeScheduler>(config, repo, prober, oracle, pool);
  }

  ~Fixture() {
    pool->Shutdown();
  }

  int64_t AddInstance(const std::string& domain, bool bad = false, bool enabled = true) {
    db::model::InstanceRecord record;
    record.domain      = domain;
    record.url         = "https://" + domain;
    record.is_bad_host = bad;
    record.enabled     = enabled;
    auto tx            = repo->Begin();
    auto result        = repo->InsertInstance(*tx, record);
    assert(result);
    tx->Commit();
    return record.id;
  }

  void ServeHealthy(const std::string& domain) {
    client->Route("https://" + domain + "/jack", Respond(200, ProfilePage()));
  }

  std::vector<db::model::HealthCheckRecord> Checks(int64_t id) {
    auto tx     = repo->Begin();
    auto checks = repo->RecentHealthChecks(*tx, id, 100);
    tx->Commit();
    return checks;
  }

  std::vector<db::model::ErrorRecord> Errors(int64_t id) {
    auto tx     = repo->Begin();
    auto errors = repo->ListErrors(*tx, id, 100);
    tx->Commit();
    return errors;
  }
};

void TestTickProbesEveryEnabledInstanceOnce() {
  Fixture f("scanner:\n  workers: 4\n");
  auto    a = f.AddInstance("a.example");
  auto    b = f.AddInstance("b.example");
  auto    c = f.AddInstance("c.example", false, false);
  f.ServeHealthy("a.example");

  auto summary = f.scheduler->RunTick();
  assert(summary.dispatched == 2);
  assert(summary.completed == 2);
  assert(summary.expired == 0);
  assert(!summary.deadline_hit);
  assert(f.scheduler->InFlight() == 0);

  assert(f.Checks(a).size() == 1);
  assert(f.Checks(a).front().healthy);
  assert(f.Errors(a).empty());

  assert(f.Checks(b).size() == 1);
  assert(!f.Checks(b).front().healthy);
  auto errors = f.Errors(b);
  assert(errors.size() == 1);
  assert(errors.front().category == v1::ERROR_CATEGORY_TRANSIENT_NETWORK);

  assert(f.Checks(c).empty());
}

void TestDeadlineExpiresQueuedProbes() {
  Fixture f("scanner:\n  workers: 1\n  tick_deadline: \"0.1s\"\n");
  auto    a = f.AddInstance("a.example");
  auto    b = f.AddInstance("b.example");
  auto    c = f.AddInstance("c.example", true);
  for (const auto* d : {"a.example", "b.example", "c.example"}) f.ServeHealthy(d);

  // every request takes 80ms, so the first probe alone outlives the deadline
  f.client->SetDelay(80ms);
  auto summary = f.scheduler->RunTick();
  assert(summary.dispatched == 3);
  assert(summary.deadline_hit);
  assert(summary.overran == 3);

  assert(WaitFor([&] { return f.scheduler->InFlight() == 0; }));

  assert(f.Checks(a).size() == 1);
  assert(f.Checks(a).front().healthy);

  auto late = f.Checks(b);
  assert(late.size() == 1);
  assert(!late.front().healthy);
  assert(!late.front().response_time_ms);
  auto errors = f.Errors(b);
  assert(errors.size() == 1);
  assert(errors.front().category == v1::ERROR_CATEGORY_DEADLINE);

  // expired probes are still recorded for bad hosts
  assert(f.Checks(c).size() == 1);
  assert(f.Errors(c).size() == 1);
}

void TestInFlightInstancesAreSkipped() {
  Fixture f("scanner:\n  workers: 2\n  tick_deadline: \"0.05s\"\n");
  auto    a = f.AddInstance("a.example");

  auto release = std::make_shared<std::atomic<bool>>(false);
  f.client->Route("https://a.example/jack", [release](const http::HttpRequest&) {
    while (!release->load()) std::this_thread::sleep_for(1ms);
    return Respond(200, ProfilePage());
  });

  auto first = f.scheduler->RunTick();
  assert(first.deadline_hit);
  assert(first.overran == 1);
  assert(f.scheduler->InFlight() == 1);

  auto second = f.scheduler->RunTick();
  assert(second.skipped_in_flight == 1);
  assert(second.dispatched == 0);
  assert(!second.deadline_hit);

  release->store(true);
  assert(WaitFor([&] { return f.scheduler->InFlight() == 0; }));
  assert(f.Checks(a).size() == 1);

  auto third = f.scheduler->RunTick();
  assert(third.dispatched == 1);
  assert(third.skipped_in_flight == 0);
  assert(WaitFor([&] { return f.scheduler->InFlight() == 0; }));
  assert(f.Checks(a).size() == 2);
}

void TestAutoMuteUsesLatestCheck() {
  Fixture f("scanner:\n  auto_mute: true\n");
  auto    a = f.AddInstance("a.example");
  f.client->Route("https://a.example/jack", Respond(500, "boom"));

  f.scheduler->RunTick();
  assert(f.Errors(a).size() == 1);

  // the latest check is unhealthy now: further failures are muted
  f.scheduler->RunTick();
  f.scheduler->RunTick();
  assert(f.Checks(a).size() == 3);
  assert(f.Errors(a).size() == 1);

  f.ServeHealthy("a.example");
  f.scheduler->RunTick();
  f.client->Route("https://a.example/jack", Respond(500, "boom again"));
  f.scheduler->RunTick();
  auto errors = f.Errors(a);
  assert(errors.size() == 2);
  assert(errors.front().http_body == "boom again");
}

void TestErrorCapIsEnforcedOnInsert() {
  Fixture f("retention:\n  error_retention_per_host: 2\n");
  auto    a = f.AddInstance("a.example");
  f.client->Route("https://a.example/jack", Respond(500, "boom"));

  for (int i = 0; i < 5; ++i) f.scheduler->RunTick();
  assert(f.Checks(a).size() == 5);

  auto tx = f.repo->Begin();
  assert(f.repo->CountErrors(*tx, a) == 2);
  tx->Commit();
}

void TestInterruptStopsWaiting() {
  Fixture f("scanner:\n  workers: 1\n  probe_interval: \"600s\"\n  tick_deadline: \"300s\"\n");
  f.AddInstance("a.example");

  auto release = std::make_shared<std::atomic<bool>>(false);
  f.client->Route("https://a.example/jack", [release](const http::HttpRequest&) {
    while (!release->load()) std::this_thread::sleep_for(1ms);
    return Respond(200, ProfilePage());
  });

  std::thread interrupter([&] {
    std::this_thread::sleep_for(50ms);
    f.scheduler->Interrupt();
  });

  const auto started = std::chrono::steady_clock::now();
  auto       summary = f.scheduler->RunTick();
  interrupter.join();
  assert(std::chrono::steady_clock::now() - started < 5s);
  assert(summary.overran == 1);

  // no new work after an interrupt
  release->store(true);
  assert(WaitFor([&] { return f.scheduler->InFlight() == 0; }));
  assert(f.scheduler->RunTick().dispatched == 0);
}

} // namespace

int main() {
  TestTickProbesEveryEnabledInstanceOnce();
  TestDeadlineExpiresQueuedProbes();
  TestInFlightInstancesAreSkipped();
  TestAutoMuteUsesLatestCheck();
  TestErrorCapIsEnforcedOnInsert();
  TestInterruptStopsWaiting();

  std::cout << "probe_scheduler_test: pass\n";
  return 0;
}
