#include "probe_scheduler.hpp"

#include <unordered_map>

#include "internal/http/fetch_error.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/time.hpp"

namespace mirrorwatch::scheduler {

using SteadyClock = std::chrono::steady_clock;

namespace {

void LogStorageFailure(const char* what, const std::string& domain, const db::Result& result) {
  MIRRORWATCH_LOG_ERROR("failed to store probe result", {observability::StringField("step", what), observability::StringField("domain", domain),
                                                         observability::StringField("error", result.Describe())});
}

} // namespace

ProbeScheduler::ProbeScheduler(const mirrorwatch::runtime::config::RuntimeConfig& config, std::shared_ptr<db::Repository> repository,
                               std::shared_ptr<probe::HealthProber> prober, std::shared_ptr<upstream::VersionOracle> oracle,
                               std::shared_ptr<WorkerPool> pool)
    : repository_(std::move(repository)),
      prober_(std::move(prober)),
      oracle_(std::move(oracle)),
      pool_(std::move(pool)),
      tick_deadline_(util::ToMillis(config.scanner().tick_deadline(), std::chrono::seconds(720))),
      error_retention_(config.retention().error_retention_per_host()),
      auto_mute_(config.scanner().auto_mute()) {
}

std::size_t ProbeScheduler::InFlight() const {
  std::lock_guard lock(in_flight_mutex_);
  return in_flight_.size();
}

void ProbeScheduler::Interrupt() {
  std::shared_ptr<Tick> tick;
  {
    std::lock_guard lock(in_flight_mutex_);
    interrupted_ = true;
    tick         = current_;
  }
  if (tick) {
    std::lock_guard lock(tick->mutex);
    tick->cv.notify_all();
  }
}

TickSummary ProbeScheduler::RunTick() {
  observability::SpanScope span("scheduler.tick");

  TickSummary summary;

  std::vector<db::model::InstanceRecord>      instances;
  std::unordered_map<int64_t, bool>           last_healthy;
  {
    auto tx   = repository_->Begin();
    instances = repository_->ListInstances(*tx, true);
    for (const auto& check : repository_->LatestHealthChecks(*tx)) {
      last_healthy[check.instance_id] = check.healthy;
    }
    tx->Commit();
  }

  auto tick      = std::make_shared<Tick>();
  tick->deadline = SteadyClock::now() + tick_deadline_;

  probe::ProbeContext base;
  base.upstream = oracle_->Current();

  {
    std::lock_guard lock(in_flight_mutex_);
    if (interrupted_) return summary;
    current_ = tick;
  }

  for (const auto& instance : instances) {
    {
      std::lock_guard lock(in_flight_mutex_);
      if (!in_flight_.insert(instance.id).second) {
        ++summary.skipped_in_flight;
        MIRRORWATCH_LOG_WARN("instance still probing from an earlier tick, skipping", {observability::StringField("domain", instance.domain)});
        continue;
      }
    }

    auto context                 = base;
    auto it                      = last_healthy.find(instance.id);
    context.last_check_unhealthy = it != last_healthy.end() && !it->second;

    {
      std::lock_guard lock(tick->mutex);
      ++tick->remaining;
    }
    if (!pool_->Submit([this, instance, context, tick] { Execute(instance, context, tick); })) {
      Finish(instance.id, tick, false);
      break;
    }
    ++summary.dispatched;
  }

  {
    std::unique_lock lock(tick->mutex);
    const bool done = tick->cv.wait_until(lock, tick->deadline, [&] {
      std::lock_guard in_flight_lock(in_flight_mutex_);
      return tick->remaining == 0 || interrupted_;
    });

    summary.deadline_hit = !done;
    summary.expired      = tick->expired;
    summary.overran      = tick->remaining;
    summary.completed    = summary.dispatched - tick->remaining - tick->expired;
  }

  {
    std::lock_guard lock(in_flight_mutex_);
    current_.reset();
  }

  span.SetAttribute("dispatched", static_cast<std::int64_t>(summary.dispatched));
  if (summary.deadline_hit) {
    span.RecordError("tick deadline reached");
    MIRRORWATCH_LOG_WARN("probe tick hit its deadline", {observability::IntField("dispatched", static_cast<std::int64_t>(summary.dispatched)),
                                                         observability::IntField("completed", static_cast<std::int64_t>(summary.completed)),
                                                         observability::IntField("expired", static_cast<std::int64_t>(summary.expired)),
                                                         observability::IntField("still_running", static_cast<std::int64_t>(summary.overran))});
  } else {
    MIRRORWATCH_LOG_INFO("probe tick finished", {observability::IntField("dispatched", static_cast<std::int64_t>(summary.dispatched)),
                                                 observability::IntField("expired", static_cast<std::int64_t>(summary.expired)),
                                                 observability::IntField("skipped", static_cast<std::int64_t>(summary.skipped_in_flight))});
  }

  return summary;
}

void ProbeScheduler::Execute(const db::model::InstanceRecord& instance, const probe::ProbeContext& context, const std::shared_ptr<Tick>& tick) {
  const bool muted = auto_mute_ && (instance.is_bad_host || context.last_check_unhealthy);

  if (SteadyClock::now() >= tick->deadline) {
    Persist(probe::ProbeFailure{instance.id, v1::ERROR_CATEGORY_DEADLINE, "probe not started before the tick deadline"}, instance, muted);
    observability::Metrics::Instance().RecordDeadlineExpired(1);
    Finish(instance.id, tick, true);
    return;
  }

  probe::ProbeOutcome outcome;
  try {
    outcome = prober_->Probe(instance, context);
  } catch (const std::exception& e) {
    outcome = probe::ProbeFailure{instance.id, v1::ERROR_CATEGORY_INTERNAL, std::string("probe failed: ") + e.what()};
  }

  Persist(outcome, instance, muted);
  Finish(instance.id, tick, false);
}

void ProbeScheduler::Finish(int64_t instance_id, const std::shared_ptr<Tick>& tick, bool expired) {
  {
    std::lock_guard lock(in_flight_mutex_);
    in_flight_.erase(instance_id);
  }
  std::lock_guard lock(tick->mutex);
  --tick->remaining;
  if (expired) ++tick->expired;
  tick->cv.notify_all();
}

void ProbeScheduler::Persist(const probe::ProbeOutcome& outcome, const db::model::InstanceRecord& instance, bool muted) {
  db::model::HealthCheckRecord          check;
  std::optional<db::model::ErrorRecord> error;

  if (const auto* report = std::get_if<probe::ProbeReport>(&outcome)) {
    check = report->check;
    error = report->error;
  } else {
    const auto& failure = std::get<probe::ProbeFailure>(outcome);

    check.instance_id   = instance.id;
    check.checked_at_ms = util::ToUnixMillis(util::Now());
    check.healthy       = false;

    observability::Metrics::Instance().RecordProbe(http::CategoryName(failure.category));
    if (muted) {
      MIRRORWATCH_LOG_DEBUG("probe failed (muted)", {observability::StringField("domain", instance.domain), observability::StringField("error", failure.message)});
    } else {
      MIRRORWATCH_LOG_WARN("probe failed", {observability::StringField("domain", instance.domain), observability::StringField("error", failure.message)});
      db::model::ErrorRecord record;
      record.instance_id    = instance.id;
      record.occurred_at_ms = check.checked_at_ms;
      record.category       = failure.category;
      record.message        = failure.message;
      error                 = std::move(record);
    }
  }

  try {
    auto tx = repository_->Begin();

    if (auto result = repository_->InsertHealthCheck(*tx, check); !result) {
      LogStorageFailure("health_check", instance.domain, result);
      return;
    }

    if (error) {
      if (auto result = repository_->InsertError(*tx, *error); !result) {
        LogStorageFailure("error", instance.domain, result);
        return;
      }
      if (auto result = repository_->TrimErrors(*tx, instance.id, error_retention_); !result) {
        LogStorageFailure("trim_errors", instance.domain, result);
        return;
      }
    }

    tx->Commit();
  } catch (const std::exception& e) {
    MIRRORWATCH_LOG_ERROR("failed to store probe result", {observability::StringField("domain", instance.domain), observability::StringField("error", e.what())});
  }
}

} // namespace mirrorwatch::scheduler
