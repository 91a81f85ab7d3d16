#include "stats_collector.hpp"

#include <google/protobuf/util/json_util.h>

#include <condition_variable>
#include <mutex>

#include "internal/http/url.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/strings.hpp"
#include "internal/util/time.hpp"

namespace mirrorwatch::retention {

StatsParseOutcome ParseHealthReport(const std::string& body) {
  v1::HealthReport                         report;
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  const auto status = google::protobuf::util::JsonStringToMessage(body, &report, options);
  if (!status.ok()) {
    return StatsParseError{"failed to parse stats document: " + std::string(status.message())};
  }

  if (!report.has_accounts() && !report.has_sessions()) {
    return StatsParseError{"stats document has neither accounts nor sessions"};
  }
  if (!report.has_requests()) {
    return StatsParseError{"stats document has no requests"};
  }

  const auto& accounts = report.has_accounts() ? report.accounts() : report.sessions();

  std::map<std::string, int64_t> counters;
  counters[kAccountsTotal]   = accounts.total();
  counters[kAccountsLimited] = accounts.limited();
  counters[kRequestsTotal]   = report.requests().total();
  return counters;
}

StatsCollector::StatsCollector(const mirrorwatch::runtime::config::RuntimeConfig& config, std::shared_ptr<http::HttpClient> client,
                               std::shared_ptr<db::Repository> repository, std::shared_ptr<scheduler::WorkerPool> pool)
    : client_(std::move(client)),
      repository_(std::move(repository)),
      pool_(std::move(pool)),
      overrides_(config),
      request_timeout_(util::ToMillis(config.scanner().request_timeout(), std::chrono::seconds(10))) {
}

std::optional<db::model::StatsSnapshotRecord> StatsCollector::Poll(const db::model::InstanceRecord& instance, uint64_t collected_at_ms,
                                                                   CollectReport& report) {
  const auto endpoints = overrides_.Resolve(instance.domain);

  std::string path = endpoints.stats_path;
  if (!endpoints.stats_query.empty()) path += "?" + endpoints.stats_query;

  http::HttpRequest request;
  request.url     = http::JoinUrl(instance.url, path);
  request.timeout = request_timeout_;
  if (!endpoints.bearer_token.empty()) {
    request.headers.emplace_back("Authorization", "Bearer " + endpoints.bearer_token);
  }

  auto outcome = http::Fetch(*client_, request);
  if (auto* error = std::get_if<http::FetchError>(&outcome)) {
    if (error->http_status && *error->http_status == 404) {
      ++report.unavailable;
      return std::nullopt;
    }
    ++report.failed;
    MIRRORWATCH_LOG_DEBUG("stats fetch failed", {observability::StringField("domain", instance.domain), observability::StringField("error", error->message)});
    return std::nullopt;
  }

  const auto& body   = std::get<http::HttpResponse>(outcome).body;
  auto        parsed = ParseHealthReport(body);
  if (auto* error = std::get_if<StatsParseError>(&parsed)) {
    ++report.failed;
    MIRRORWATCH_LOG_DEBUG("stats not parsed", {observability::StringField("domain", instance.domain), observability::StringField("error", error->message),
                                               observability::StringField("body", util::TruncateUtf8(body, 256))});
    return std::nullopt;
  }

  db::model::StatsSnapshotRecord snapshot;
  snapshot.instance_id     = instance.id;
  snapshot.collected_at_ms = collected_at_ms;
  snapshot.counters        = std::move(std::get<std::map<std::string, int64_t>>(parsed));
  return snapshot;
}

CollectReport StatsCollector::Collect() {
  observability::SpanScope span("stats.collect");

  std::vector<db::model::InstanceRecord> instances;
  {
    auto tx   = repository_->Begin();
    instances = repository_->ListInstances(*tx, true);
    tx->Commit();
  }

  const auto collected_at_ms = util::ToUnixMillis(util::Now());

  CollectReport                               report;
  std::vector<db::model::StatsSnapshotRecord> snapshots;
  std::mutex                                  mutex;
  std::condition_variable                     cv;
  std::size_t                                 remaining = 0;

  for (const auto& instance : instances) {
    {
      std::lock_guard lock(mutex);
      ++remaining;
    }
    const bool submitted = pool_->Submit([&, instance] {
      CollectReport local;
      auto          snapshot = Poll(instance, collected_at_ms, local);

      std::lock_guard lock(mutex);
      ++report.polled;
      report.unavailable += local.unavailable;
      report.failed += local.failed;
      if (snapshot) snapshots.push_back(std::move(*snapshot));
      --remaining;
      cv.notify_all();
    });
    if (!submitted) {
      std::lock_guard lock(mutex);
      --remaining;
      break;
    }
  }

  {
    std::unique_lock lock(mutex);
    // Jobs dropped by a pool shutdown never report back.
    while (!cv.wait_for(lock, std::chrono::milliseconds(500), [&] { return remaining == 0; })) {
      if (pool_->Stopped()) return report;
    }
  }

  if (!snapshots.empty()) {
    auto tx = repository_->Begin();
    for (const auto& snapshot : snapshots) {
      if (auto result = repository_->InsertStatsSnapshot(*tx, snapshot); !result) {
        throw util::StorageError("insert stats snapshot: " + result.Describe());
      }
    }
    tx->Commit();
  }
  report.stored = snapshots.size();

  span.SetAttribute("stored", static_cast<std::int64_t>(report.stored));
  auto& metrics = observability::Metrics::Instance();
  metrics.RecordStatsPolls("stored", report.stored);
  metrics.RecordStatsPolls("unavailable", report.unavailable);
  metrics.RecordStatsPolls("failed", report.failed);
  MIRRORWATCH_LOG_INFO("stats collected", {observability::IntField("polled", static_cast<std::int64_t>(report.polled)),
                                           observability::IntField("stored", static_cast<std::int64_t>(report.stored)),
                                           observability::IntField("unavailable", static_cast<std::int64_t>(report.unavailable)),
                                           observability::IntField("failed", static_cast<std::int64_t>(report.failed))});
  return report;
}

} // namespace mirrorwatch::retention
