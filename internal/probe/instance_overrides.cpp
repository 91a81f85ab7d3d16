#include "instance_overrides.hpp"

#include <set>

#include "internal/http/url.hpp"
#include "internal/observability/logging.hpp"

namespace mirrorwatch::probe {

OverrideTable::OverrideTable(const mirrorwatch::runtime::config::RuntimeConfig& config) {
  defaults_.profile_path = config.probe().profile_path();
  defaults_.rss_path     = config.probe().rss_path();
  defaults_.about_path   = config.probe().about_path();
  defaults_.stats_path   = config.stats().path();

  for (const auto& entry : config.instance_overrides()) {
    overrides_[http::NormalizeHost(entry.domain())] = entry;
  }
}

InstanceEndpoints OverrideTable::Resolve(const std::string& domain) const {
  InstanceEndpoints endpoints = defaults_;

  auto it = overrides_.find(domain);
  if (it == overrides_.end()) {
    return endpoints;
  }

  const auto& o = it->second;
  if (!o.profile_path().empty()) endpoints.profile_path = o.profile_path();
  if (!o.rss_path().empty()) endpoints.rss_path = o.rss_path();
  if (!o.about_path().empty()) endpoints.about_path = o.about_path();
  if (!o.stats_path().empty()) endpoints.stats_path = o.stats_path();
  endpoints.stats_query  = o.stats_query();
  endpoints.bearer_token = o.bearer_token();
  return endpoints;
}

void OverrideTable::WarnUnmatched(const std::vector<db::model::InstanceRecord>& instances) const {
  std::set<std::string> domains;
  for (const auto& instance : instances) domains.insert(instance.domain);

  for (const auto& [domain, entry] : overrides_) {
    if (!domains.count(domain)) {
      MIRRORWATCH_LOG_WARN("override for untracked instance", {observability::StringField("domain", domain)});
    }
  }
}

} // namespace mirrorwatch::probe
