#include "instance_registry.hpp"

#include <set>

#include "internal/http/url.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace mirrorwatch::registry {

using db::model::InstanceRecord;

namespace {

void Require(const db::Result& result, const char* what) {
  if (!result) {
    throw util::StorageError(std::string(what) + ": " + result.Describe());
  }
}

} // namespace

InstanceRegistry::InstanceRegistry(mirrorwatch::runtime::config::RegistryConfig config, std::shared_ptr<http::HttpClient> client,
                                   std::shared_ptr<db::Repository> repository, std::chrono::milliseconds request_timeout)
    : config_(std::move(config)), client_(std::move(client)), repository_(std::move(repository)), request_timeout_(request_timeout) {
}

ReconcileOutcome InstanceRegistry::Reconcile() {
  observability::SpanScope span("registry.reconcile");

  http::HttpRequest request;
  request.url     = config_.list_url();
  request.timeout = request_timeout_;

  auto outcome = http::Fetch(*client_, request);
  if (auto* error = std::get_if<http::FetchError>(&outcome)) {
    span.RecordError(error->message);
    MIRRORWATCH_LOG_WARN("instance list fetch failed, keeping known instances", {observability::StringField("error", error->message)});
    return *error;
  }

  auto parsed = ParseInstanceList(std::get<http::HttpResponse>(outcome).body);
  if (auto* error = std::get_if<ListParseError>(&parsed)) {
    span.RecordError(error->message);
    MIRRORWATCH_LOG_WARN("instance list parse failed, keeping known instances", {observability::StringField("error", error->message)});
    return *error;
  }

  auto report = Apply(std::get<ListedInstances>(parsed));
  span.SetAttribute("added", static_cast<std::int64_t>(report.added.size()));
  span.SetAttribute("removed_candidates", static_cast<std::int64_t>(report.removed_candidates.size()));
  MIRRORWATCH_LOG_INFO("instance list reconciled", {observability::IntField("added", static_cast<std::int64_t>(report.added.size())),
                                                    observability::IntField("retained", static_cast<std::int64_t>(report.retained.size())),
                                                    observability::IntField("removed_candidates",
                                                                            static_cast<std::int64_t>(report.removed_candidates.size()))});
  return report;
}

ListedInstances InstanceRegistry::Merge(const ListedInstances& listed) const {
  ListedInstances merged = listed;
  for (const auto& host : config_.additional_hosts()) {
    const auto domain = http::NormalizeHost(host);
    if (domain.empty()) {
      MIRRORWATCH_LOG_WARN("ignoring invalid additional host", {observability::StringField("host", host)});
      continue;
    }

    ListedInstance instance;
    instance.domain  = domain;
    instance.url     = host.find("://") == std::string::npos ? http::BaseUrlFor(domain) : host;
    instance.online  = true;
    instance.country = config_.additional_host_country();
    merged[domain]   = std::move(instance);
  }
  return merged;
}

ReconcileReport InstanceRegistry::Apply(const ListedInstances& listed) {
  const auto merged = Merge(listed);
  const auto now_ms = util::ToUnixMillis(util::Now());

  std::set<std::string> additional;
  for (const auto& host : config_.additional_hosts()) additional.insert(http::NormalizeHost(host));
  std::set<std::string> bad;
  for (const auto& host : config_.bad_hosts()) bad.insert(http::NormalizeHost(host));

  ReconcileReport report;

  auto tx       = repository_->Begin();
  auto existing = repository_->ListInstances(*tx, false);

  std::set<std::string> known;
  for (auto& record : existing) {
    known.insert(record.domain);

    auto it = merged.find(record.domain);
    if (it == merged.end()) {
      if (!record.enabled) continue;

      record.missed_passes += 1;
      record.is_additional = false;
      if (config_.retire_after_missed_passes() > 0 && record.missed_passes >= config_.retire_after_missed_passes()) {
        record.enabled = false;
        MIRRORWATCH_LOG_INFO("retiring instance missing from listing",
                             {observability::StringField("domain", record.domain), observability::IntField("missed_passes", record.missed_passes)});
      }
      record.updated_at_ms = now_ms;
      Require(repository_->UpdateInstance(*tx, record), "update instance");
      report.removed_candidates.push_back(record);
      continue;
    }

    InstanceRecord updated = record;
    updated.url            = http::BaseUrlFor(record.domain, it->second.url);
    updated.country        = it->second.country;
    updated.is_additional  = additional.count(record.domain) > 0;
    updated.is_bad_host    = bad.count(record.domain) > 0;
    updated.enabled        = true;
    updated.missed_passes  = 0;

    const bool changed = updated.url != record.url || updated.country != record.country || updated.is_additional != record.is_additional ||
                         updated.is_bad_host != record.is_bad_host || updated.enabled != record.enabled ||
                         updated.missed_passes != record.missed_passes;
    if (changed) {
      if (!record.enabled) {
        MIRRORWATCH_LOG_INFO("re-enabling instance back in listing", {observability::StringField("domain", record.domain)});
      }
      updated.updated_at_ms = now_ms;
      Require(repository_->UpdateInstance(*tx, updated), "update instance");
    }
    report.retained.push_back(updated);
  }

  for (const auto& [domain, instance] : merged) {
    if (known.count(domain)) continue;

    InstanceRecord record;
    record.domain        = domain;
    record.url           = http::BaseUrlFor(domain, instance.url);
    record.country       = instance.country;
    record.is_additional = additional.count(domain) > 0;
    record.is_bad_host   = bad.count(domain) > 0;
    record.enabled       = true;
    record.created_at_ms = now_ms;
    record.updated_at_ms = now_ms;
    Require(repository_->InsertInstance(*tx, record), "insert instance");
    MIRRORWATCH_LOG_INFO("tracking new instance", {observability::StringField("domain", domain)});
    report.added.push_back(record);
  }

  tx->Commit();
  return report;
}

} // namespace mirrorwatch::registry
