#include "status_service.hpp"

#include <algorithm>
#include <map>

#include "internal/db/api/repository.hpp"
#include "internal/http/url.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace mirrorwatch::service {

using namespace mirrorwatch::v1;

namespace {

constexpr uint64_t kDefaultSpanMs   = 7 * util::kMillisPerDay;
constexpr uint64_t kDefaultBucketMs = util::kMillisPerHour;
constexpr uint64_t kMaxBuckets      = 10000;

template <typename Fn>
auto ObserveRpc(std::string_view route, Fn&& fn) {
  observability::SpanScope span(route);
  try {
    auto result = fn();
    observability::Metrics::Instance().RecordRequest(route, true);
    return result;
  } catch (const std::exception& ex) {
    span.RecordError(ex.what());
    MIRRORWATCH_LOG_WARN("RPC failed", {observability::StringField("route", route), observability::StringField("error", ex.what())});
    observability::Metrics::Instance().RecordRequest(route, false);
    throw;
  }
}

// Bucketed [from, to) window of a history query.
struct Window {
  uint64_t from_ms   = 0;
  uint64_t to_ms     = 0;
  uint64_t bucket_ms = 0;

  std::size_t Buckets() const {
    return static_cast<std::size_t>((to_ms - from_ms + bucket_ms - 1) / bucket_ms);
  }

  std::size_t IndexOf(uint64_t at_ms) const {
    return static_cast<std::size_t>((at_ms - from_ms) / bucket_ms);
  }

  uint64_t StartOf(std::size_t index) const {
    return from_ms + index * bucket_ms;
  }
};

Window ResolveWindow(const google::protobuf::Timestamp* start, const google::protobuf::Timestamp* end,
                     const google::protobuf::Duration* bucket) {
  Window window;
  window.to_ms     = end ? util::ProtoToMillis(*end) : util::ToUnixMillis(util::Now());
  window.from_ms   = start ? util::ProtoToMillis(*start) : (window.to_ms > kDefaultSpanMs ? window.to_ms - kDefaultSpanMs : 0);
  window.bucket_ms = bucket ? static_cast<uint64_t>(util::ToMillis(*bucket).count()) : kDefaultBucketMs;

  if (window.from_ms >= window.to_ms) {
    throw util::InvalidArgument("start must be before end");
  }
  if (window.bucket_ms == 0) {
    throw util::InvalidArgument("bucket must be positive");
  }
  if (window.Buckets() > kMaxBuckets) {
    throw util::InvalidArgument("too many buckets, widen the bucket size");
  }
  return window;
}

std::optional<int64_t> ResolveInstanceId(db::Repository& repository, db::Transaction& tx, const std::string& domain) {
  if (domain.empty()) return std::nullopt;

  auto instance = repository.GetInstanceByDomain(tx, http::NormalizeHost(domain));
  if (!instance) {
    throw util::NotFound("unknown instance: " + domain);
  }
  return instance->id;
}

UpstreamInfo ToUpstreamInfo(const std::optional<db::model::UpstreamVersionRecord>& record) {
  UpstreamInfo info;
  if (record) {
    info.set_commit(record->commit);
    info.set_branch(record->branch);
    *info.mutable_refreshed_at() = util::MillisToProto(record->refreshed_at_ms);
  }
  return info;
}

ErrorEntry ToErrorEntry(const db::model::ErrorRecord& record) {
  ErrorEntry entry;
  *entry.mutable_occurred_at() = util::MillisToProto(record.occurred_at_ms);
  entry.set_category(record.category);
  entry.set_message(record.message);
  entry.set_http_status(record.http_status.value_or(0));
  entry.set_http_body(record.http_body);
  return entry;
}

} // namespace

InstanceSnapshot ToSnapshot(const scoring::InstanceScore& score) {
  InstanceSnapshot snapshot;

  const auto& instance = score.instance;
  snapshot.set_id(instance.id);
  snapshot.set_domain(instance.domain);
  snapshot.set_url(instance.url);
  snapshot.set_country(instance.country);
  snapshot.set_is_additional(instance.is_additional);
  snapshot.set_is_bad_host(instance.is_bad_host);
  snapshot.set_enabled(instance.enabled);
  snapshot.set_stale(instance.missed_passes > 0);

  snapshot.set_healthy_now(score.healthy_now);
  snapshot.set_never_seen_healthy(score.never_seen_healthy);
  if (score.last_healthy_ms) *snapshot.mutable_last_healthy() = util::MillisToProto(*score.last_healthy_ms);

  if (score.avg_response_ms) snapshot.set_avg_response_ms(*score.avg_response_ms);
  if (score.min_response_ms) snapshot.set_min_response_ms(*score.min_response_ms);
  if (score.max_response_ms) snapshot.set_max_response_ms(*score.max_response_ms);
  if (score.pct_recent) snapshot.set_pct_recent(*score.pct_recent);
  if (score.pct_30d) snapshot.set_pct_30d(*score.pct_30d);
  if (score.pct_120d) snapshot.set_pct_120d(*score.pct_120d);
  if (score.overall_pct) snapshot.set_overall_pct(*score.overall_pct);
  snapshot.set_points(score.points);
  snapshot.set_rank(score.rank);
  snapshot.set_commit_status(score.commit_status);

  if (score.latest) {
    const auto& latest = *score.latest;
    *snapshot.mutable_last_checked() = util::MillisToProto(latest.checked_at_ms);
    snapshot.set_rss(latest.rss);
    snapshot.set_version(latest.version.value_or(""));
    snapshot.set_version_url(latest.version_url.value_or(""));
    snapshot.set_is_upstream(latest.is_upstream);
    snapshot.set_is_latest_version(latest.is_latest_version);
    snapshot.set_connectivity(latest.connectivity);
  }

  for (const auto& check : score.recent_checks) {
    auto* recent                  = snapshot.add_recent_checks();
    *recent->mutable_checked_at() = util::MillisToProto(check.checked_at_ms);
    recent->set_healthy(check.healthy);
    if (check.response_time_ms) recent->set_response_ms(*check.response_time_ms);
  }

  return snapshot;
}

StatusService::StatusService(ServiceContext ctx) : ctx_(std::move(ctx)) {
}

ListInstancesResponse StatusService::ListInstances(const ListInstancesRequest& req) {
  return ObserveRpc("StatusService.ListInstances", [&] {
    ListInstancesResponse resp;
    const auto            now_ms = util::ToUnixMillis(util::Now());

    auto tx        = ctx_.repository->Begin();
    auto instances = ctx_.repository->ListInstances(*tx, !req.include_disabled());

    // Disabled instances are listed but never ranked.
    std::vector<db::model::InstanceRecord> enabled;
    std::vector<db::model::InstanceRecord> disabled;
    for (auto& instance : instances) {
      (instance.enabled ? enabled : disabled).push_back(std::move(instance));
    }

    auto scores = ctx_.scoring->ScoreAll(*ctx_.repository, *tx, enabled, now_ms);
    for (const auto& instance : disabled) {
      scores.push_back(ctx_.scoring->Score(*ctx_.repository, *tx, instance, now_ms));
    }

    *resp.mutable_upstream() = ToUpstreamInfo(ctx_.repository->GetUpstreamVersion(*tx));
    tx->Commit();

    for (const auto& score : scores) {
      *resp.add_instances() = ToSnapshot(score);
    }
    *resp.mutable_generated_at() = util::MillisToProto(now_ms);
    return resp;
  });
}

GetInstanceResponse StatusService::GetInstance(const GetInstanceRequest& req) {
  return ObserveRpc("StatusService.GetInstance", [&] {
    if (req.domain().empty()) {
      throw util::InvalidArgument("domain is required");
    }

    GetInstanceResponse resp;
    const auto          now_ms = util::ToUnixMillis(util::Now());

    auto tx       = ctx_.repository->Begin();
    auto instance = ctx_.repository->GetInstanceByDomain(*tx, http::NormalizeHost(req.domain()));
    if (!instance) {
      throw util::NotFound("unknown instance: " + req.domain());
    }

    std::optional<scoring::InstanceScore> found;
    if (instance->enabled) {
      // Rank is relative to the whole enabled fleet.
      for (auto& score : ctx_.scoring->ScoreAll(*ctx_.repository, *tx, ctx_.repository->ListInstances(*tx, true), now_ms)) {
        if (score.instance.id == instance->id) {
          found = std::move(score);
          break;
        }
      }
    }
    if (!found) {
      found = ctx_.scoring->Score(*ctx_.repository, *tx, *instance, now_ms);
    }

    *resp.mutable_instance() = ToSnapshot(*found);
    for (const auto& error : ctx_.repository->ListErrors(*tx, instance->id, ctx_.error_limit)) {
      *resp.add_errors() = ToErrorEntry(error);
    }
    tx->Commit();
    return resp;
  });
}

HealthHistoryResponse StatusService::QueryHealthHistory(const HealthHistoryRequest& req) {
  return ObserveRpc("StatusService.QueryHealthHistory", [&] {
    const auto window = ResolveWindow(req.has_start() ? &req.start() : nullptr, req.has_end() ? &req.end() : nullptr,
                                      req.has_bucket() ? &req.bucket() : nullptr);

    struct Bucket {
      int64_t healthy = 0;
      int64_t dead    = 0;
      int64_t sum_ms  = 0;
      int64_t samples = 0;
    };
    std::vector<Bucket> buckets(window.Buckets());

    auto tx = ctx_.repository->Begin();

    db::TimeRange range;
    range.from_ms     = window.from_ms;
    range.to_ms       = window.to_ms;
    range.instance_id = ResolveInstanceId(*ctx_.repository, *tx, req.domain());

    for (const auto& check : ctx_.repository->ListHealthChecks(*tx, range)) {
      auto& bucket = buckets[window.IndexOf(check.checked_at_ms)];
      if (check.healthy) {
        ++bucket.healthy;
        if (check.response_time_ms) {
          bucket.sum_ms += *check.response_time_ms;
          ++bucket.samples;
        }
      } else {
        ++bucket.dead;
      }
    }
    tx->Commit();

    HealthHistoryResponse resp;
    for (std::size_t i = 0; i < buckets.size(); ++i) {
      auto* out               = resp.add_buckets();
      *out->mutable_start()   = util::MillisToProto(window.StartOf(i));
      out->set_healthy(buckets[i].healthy);
      out->set_dead(buckets[i].dead);
      if (buckets[i].samples > 0) {
        out->set_avg_response_ms(static_cast<double>(buckets[i].sum_ms) / static_cast<double>(buckets[i].samples));
      }
    }
    return resp;
  });
}

StatsResponse StatusService::QueryStats(const StatsRequest& req) {
  return ObserveRpc("StatusService.QueryStats", [&] {
    const auto window = ResolveWindow(req.has_start() ? &req.start() : nullptr, req.has_end() ? &req.end() : nullptr,
                                      req.has_bucket() ? &req.bucket() : nullptr);

    auto tx = ctx_.repository->Begin();

    db::TimeRange range;
    range.from_ms     = window.from_ms;
    range.to_ms       = window.to_ms;
    range.instance_id = ResolveInstanceId(*ctx_.repository, *tx, req.domain());
    auto snapshots    = ctx_.repository->ListStatsSnapshots(*tx, range);
    tx->Commit();

    // Fleet-wide queries sum all instances of one collection tick first.
    std::map<uint64_t, std::map<std::string, int64_t>> ticks;
    for (const auto& snapshot : snapshots) {
      auto& tick = ticks[snapshot.collected_at_ms];
      for (const auto& [name, value] : snapshot.counters) tick[name] += value;
    }

    struct Summary {
      int64_t min     = 0;
      int64_t max     = 0;
      double  sum     = 0;
      int64_t samples = 0;
    };
    std::map<std::size_t, std::map<std::string, Summary>> buckets;
    for (const auto& [at_ms, counters] : ticks) {
      auto& bucket = buckets[window.IndexOf(at_ms)];
      for (const auto& [name, value] : counters) {
        auto& summary = bucket[name];
        if (summary.samples == 0) {
          summary.min = value;
          summary.max = value;
        } else {
          summary.min = std::min(summary.min, value);
          summary.max = std::max(summary.max, value);
        }
        summary.sum += static_cast<double>(value);
        ++summary.samples;
      }
    }

    StatsResponse resp;
    for (const auto& [index, counters] : buckets) {
      auto* out             = resp.add_buckets();
      *out->mutable_start() = util::MillisToProto(window.StartOf(index));
      for (const auto& [name, summary] : counters) {
        auto* counter = out->add_counters();
        counter->set_name(name);
        counter->set_min(static_cast<double>(summary.min));
        counter->set_max(static_cast<double>(summary.max));
        counter->set_avg(summary.sum / static_cast<double>(summary.samples));
        counter->set_samples(summary.samples);
      }
    }
    return resp;
  });
}

UpstreamInfo StatusService::GetUpstream(const GetUpstreamRequest&) {
  return ObserveRpc("StatusService.GetUpstream", [&] {
    auto tx   = ctx_.repository->Begin();
    auto info = ToUpstreamInfo(ctx_.repository->GetUpstreamVersion(*tx));
    tx->Commit();
    return info;
  });
}

} // namespace mirrorwatch::service
