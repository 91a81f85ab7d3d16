#include "scanner.hpp"

#include <unordered_set>

#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/time.hpp"

namespace mirrorwatch::scheduler {

using std::chrono::milliseconds;

Scanner::Scanner(const mirrorwatch::runtime::config::RuntimeConfig& config, ScannerComponents components)
    : config_(config), components_(std::move(components)) {
}

Scanner::~Scanner() {
  try {
    Stop();
  } catch (const std::exception& e) {
    MIRRORWATCH_LOG_ERROR("scanner shutdown failed", {observability::StringField("error", e.what())});
  }
}

void Scanner::RefreshRegistry() {
  auto outcome = components_.registry->Reconcile();
  if (!std::holds_alternative<registry::ReconcileReport>(outcome)) return;

  if (components_.overrides) {
    auto tx = components_.repository->Begin();
    components_.overrides->WarnUnmatched(components_.repository->ListInstances(*tx, false));
    tx->Commit();
  }
}

void Scanner::RefreshUpstream() {
  components_.oracle->Refresh();
}

void Scanner::ProbeOnce() {
  components_.probes->RunTick();
  UpdateFleetGauge();
}

void Scanner::CollectStats() {
  if (components_.stats) components_.stats->Collect();
}

void Scanner::Cleanup() {
  components_.retention->Cleanup();
}

void Scanner::UpdateFleetGauge() {
  auto tx        = components_.repository->Begin();
  auto instances = components_.repository->ListInstances(*tx, true);
  auto latest    = components_.repository->LatestHealthChecks(*tx);
  tx->Commit();

  std::unordered_set<int64_t> enabled;
  for (const auto& instance : instances) enabled.insert(instance.id);

  uint64_t healthy = 0;
  for (const auto& check : latest) {
    if (check.healthy && enabled.count(check.instance_id)) ++healthy;
  }
  observability::Metrics::Instance().SetFleetGauge(instances.size(), healthy);
}

void Scanner::Start() {
  if (started_) return;
  started_ = true;

  const auto& scanner = config_.scanner();

  tasks_.push_back(std::make_unique<PeriodicTask>("cleanup", util::ToMillis(config_.retention().cleanup_interval(), std::chrono::hours(1)),
                                                  [this] { Cleanup(); }));

  if (scanner.disable_health_checks()) {
    MIRRORWATCH_LOG_WARN("health checks disabled, only cleanup runs");
  } else {
    components_.oracle->Restore();

    // The first probe tick needs a head and a fleet to work with.
    try {
      RefreshUpstream();
      RefreshRegistry();
    } catch (const std::exception& e) {
      MIRRORWATCH_LOG_ERROR("initial refresh failed", {observability::StringField("error", e.what())});
    }

    const auto now_ms         = util::ToUnixMillis(util::Now());
    const auto probe_interval = util::ToMillis(scanner.probe_interval(), std::chrono::minutes(15));
    const auto stats_interval = util::ToMillis(config_.stats().interval(), std::chrono::minutes(15));

    std::optional<uint64_t> last_probe;
    std::optional<uint64_t> last_stats;
    {
      auto tx    = components_.repository->Begin();
      last_probe = components_.repository->LastHealthCheckAt(*tx);
      last_stats = components_.repository->LastStatsAt(*tx);
      tx->Commit();
    }

    const auto upstream_interval = util::ToMillis(config_.upstream().refresh_interval(), std::chrono::hours(1));
    const auto registry_interval = util::ToMillis(config_.registry().refresh_interval(), std::chrono::hours(1));

    tasks_.push_back(std::make_unique<PeriodicTask>("upstream", upstream_interval, [this] { RefreshUpstream(); }, upstream_interval));
    tasks_.push_back(std::make_unique<PeriodicTask>("registry", registry_interval, [this] { RefreshRegistry(); }, registry_interval));
    tasks_.push_back(std::make_unique<PeriodicTask>("probe", probe_interval, [this] { ProbeOnce(); },
                                                    ResumeDelay(last_probe, now_ms, probe_interval)));

    if (components_.stats) {
      tasks_.push_back(std::make_unique<PeriodicTask>("stats", stats_interval, [this] { CollectStats(); },
                                                      ResumeDelay(last_stats, now_ms, stats_interval)));
    }
  }

  for (auto& task : tasks_) task->Start();
  MIRRORWATCH_LOG_INFO("scanner started", {observability::IntField("loops", static_cast<std::int64_t>(tasks_.size()))});
}

void Scanner::Stop() {
  if (!started_) return;
  started_ = false;

  if (components_.probes) components_.probes->Interrupt();
  for (auto& pool : components_.pools) pool->Shutdown();
  for (auto& task : tasks_) task->Stop();
  tasks_.clear();

  MIRRORWATCH_LOG_INFO("scanner stopped");
}

} // namespace mirrorwatch::scheduler
