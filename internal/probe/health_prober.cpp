#include "health_prober.hpp"

#include <algorithm>

#include "internal/http/fetch_error.hpp"
#include "internal/http/url.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/strings.hpp"
#include "internal/util/time.hpp"
#include "page_parsers.hpp"

namespace mirrorwatch::probe {

HealthProber::HealthProber(const mirrorwatch::runtime::config::RuntimeConfig& config, std::shared_ptr<http::HttpClient> client,
                           std::shared_ptr<ConnectivityChecker> connectivity, std::shared_ptr<upstream::VersionOracle> oracle)
    : client_(std::move(client)),
      connectivity_(std::move(connectivity)),
      oracle_(std::move(oracle)),
      overrides_(config),
      profile_name_(config.probe().profile_name()),
      profile_posts_min_(config.probe().profile_posts_min()),
      rss_marker_(config.probe().rss_marker(), std::regex::icase),
      probe_timeout_(util::ToMillis(config.scanner().probe_timeout(), std::chrono::seconds(30))),
      request_timeout_(util::ToMillis(config.scanner().request_timeout(), std::chrono::seconds(10))),
      auto_mute_(config.scanner().auto_mute()),
      max_error_body_bytes_(config.retention().max_error_body_bytes()) {
}

std::chrono::milliseconds HealthProber::Budget(SteadyClock::time_point deadline) const {
  const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - SteadyClock::now());
  return std::max(std::chrono::milliseconds{0}, std::min(request_timeout_, remaining));
}

ProbeReport HealthProber::Probe(const db::model::InstanceRecord& instance, const ProbeContext& context) {
  observability::SpanScope span("probe.instance", instance.domain);

  const auto deadline  = SteadyClock::now() + probe_timeout_;
  const auto endpoints = overrides_.Resolve(instance.domain);

  ProbeReport report;
  report.muted               = auto_mute_ && (instance.is_bad_host || context.last_check_unhealthy);
  report.check.instance_id   = instance.id;
  report.check.checked_at_ms = util::ToUnixMillis(util::Now());

  std::string message;
  std::string body;
  CheckProfile(instance, endpoints, deadline, report, message, body);

  report.check.rss = CheckRss(instance, endpoints, deadline);
  CheckAbout(instance, endpoints, context, deadline, report);

  const auto budget          = Budget(deadline);
  report.check.connectivity  = budget.count() > 0 ? connectivity_->Check(instance.domain, budget) : v1::CONNECTIVITY_UNKNOWN;

  auto& metrics = observability::Metrics::Instance();
  if (report.check.response_time_ms) {
    metrics.ObserveProbeLatencyMs(static_cast<double>(*report.check.response_time_ms));
  }

  if (report.check.healthy) {
    metrics.RecordProbe("healthy");
    return report;
  }

  metrics.RecordProbe(http::CategoryName(report.category));
  span.RecordError(message);

  if (report.muted) {
    MIRRORWATCH_LOG_DEBUG("instance unhealthy (muted)", {observability::StringField("domain", instance.domain), observability::StringField("error", message)});
    return report;
  }

  MIRRORWATCH_LOG_INFO("instance unhealthy", {observability::StringField("domain", instance.domain), observability::StringField("error", message)});

  db::model::ErrorRecord error;
  error.instance_id    = instance.id;
  error.occurred_at_ms = report.check.checked_at_ms;
  error.category       = report.category;
  error.message        = message;
  error.http_status    = report.check.http_status;
  error.http_body      = util::TruncateUtf8(body, max_error_body_bytes_);
  report.error         = std::move(error);
  return report;
}

void HealthProber::CheckProfile(const db::model::InstanceRecord& instance, const InstanceEndpoints& endpoints, SteadyClock::time_point deadline,
                                ProbeReport& report, std::string& message, std::string& body) {
  http::HttpRequest request;
  request.url     = http::JoinUrl(instance.url, endpoints.profile_path);
  request.timeout = Budget(deadline);
  if (request.timeout.count() == 0) {
    report.category = v1::ERROR_CATEGORY_DEADLINE;
    message         = "probe budget exhausted";
    return;
  }

  auto result = client_->Get(request);
  if (result.response) {
    report.check.response_time_ms = result.response->elapsed.count();
    report.check.http_status      = static_cast<int32_t>(result.response->status);
  }

  if (auto error = http::ClassifyResult(result)) {
    report.category = error->category;
    message         = error->message;
    body            = std::move(error->body);
    return;
  }

  auto parsed = ParseProfile(result.response->body);
  if (auto* failure = std::get_if<ParseFailure>(&parsed)) {
    report.category = v1::ERROR_CATEGORY_CONTENT_MISMATCH;
    message         = failure->message;
    body            = result.response->body;
    return;
  }

  const auto& profile = std::get<ProfileParsed>(parsed);
  if ((!profile_name_.empty() && profile.name != profile_name_) || profile.post_count < profile_posts_min_) {
    report.category = v1::ERROR_CATEGORY_CONTENT_MISMATCH;
    message         = "profile content mismatch: name '" + profile.name + "', " + std::to_string(profile.post_count) + " posts";
    body            = result.response->body;
    return;
  }

  report.check.healthy = true;
}

bool HealthProber::CheckRss(const db::model::InstanceRecord& instance, const InstanceEndpoints& endpoints, SteadyClock::time_point deadline) {
  http::HttpRequest request;
  request.url     = http::JoinUrl(instance.url, endpoints.rss_path);
  request.timeout = Budget(deadline);
  if (request.timeout.count() == 0) return false;

  auto result = client_->Get(request);
  if (http::ClassifyResult(result)) return false;
  return std::regex_search(result.response->body, rss_marker_);
}

void HealthProber::CheckAbout(const db::model::InstanceRecord& instance, const InstanceEndpoints& endpoints, const ProbeContext& context,
                              SteadyClock::time_point deadline, ProbeReport& report) {
  http::HttpRequest request;
  request.url     = http::JoinUrl(instance.url, endpoints.about_path);
  request.timeout = Budget(deadline);
  if (request.timeout.count() == 0) return;

  auto result = client_->Get(request);
  if (http::ClassifyResult(result)) return;

  auto parsed = ParseAbout(result.response->body);
  if (auto* failure = std::get_if<ParseFailure>(&parsed)) {
    MIRRORWATCH_LOG_DEBUG("about page not parsed", {observability::StringField("domain", instance.domain), observability::StringField("error", failure->message)});
    return;
  }

  const auto& about         = std::get<AboutParsed>(parsed);
  report.check.version      = about.version;
  report.check.version_url  = about.url;

  // A fork hosting the same commit is still not upstream.
  if (!oracle_->IsUpstreamUrl(about.url)) return;

  const auto classification = context.upstream ? oracle_->Classify(about.commit, *context.upstream) : oracle_->Classify(about.commit);
  if (classification.resolved) {
    report.check.is_upstream =
        classification.status == v1::COMMIT_STATUS_CURRENT || classification.status == v1::COMMIT_STATUS_OUTDATED;
  } else {
    report.check.is_upstream = true;
  }
  report.check.is_latest_version = report.check.is_upstream && classification.status == v1::COMMIT_STATUS_CURRENT;
}

} // namespace mirrorwatch::probe
