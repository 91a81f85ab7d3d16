#pragma once

#include <chrono>
#include <memory>
#include <regex>

#include "config/config.pb.h"
#include "connectivity_checker.hpp"
#include "instance_overrides.hpp"
#include "internal/db/model/instance_record.hpp"
#include "internal/http/http_client.hpp"
#include "internal/upstream/version_oracle.hpp"
#include "probe_outcome.hpp"

namespace mirrorwatch::probe {

struct ProbeContext {
  std::shared_ptr<const upstream::UpstreamVersion> upstream;
  // latest stored check of the instance was unhealthy
  bool last_check_unhealthy = false;
};

/*
  Health Prober.

  Runs the profile, RSS, about and connectivity checks of one instance
  against a shared time budget and folds them into one health record.
  Only the profile check decides `healthy`; the others are informational.
  Never throws for network or content reasons.
*/
class HealthProber {
 public:
  HealthProber(const mirrorwatch::runtime::config::RuntimeConfig& config, std::shared_ptr<http::HttpClient> client,
               std::shared_ptr<ConnectivityChecker> connectivity, std::shared_ptr<upstream::VersionOracle> oracle);

  ProbeReport Probe(const db::model::InstanceRecord& instance, const ProbeContext& context);

 private:
  using SteadyClock = std::chrono::steady_clock;

  std::chrono::milliseconds Budget(SteadyClock::time_point deadline) const;

  void CheckProfile(const db::model::InstanceRecord& instance, const InstanceEndpoints& endpoints, SteadyClock::time_point deadline,
                    ProbeReport& report, std::string& message, std::string& body);
  bool CheckRss(const db::model::InstanceRecord& instance, const InstanceEndpoints& endpoints, SteadyClock::time_point deadline);
  void CheckAbout(const db::model::InstanceRecord& instance, const InstanceEndpoints& endpoints, const ProbeContext& context,
                  SteadyClock::time_point deadline, ProbeReport& report);

  std::shared_ptr<http::HttpClient>        client_;
  std::shared_ptr<ConnectivityChecker>     connectivity_;
  std::shared_ptr<upstream::VersionOracle> oracle_;
  OverrideTable                            overrides_;

  std::string               profile_name_;
  uint32_t                  profile_posts_min_;
  std::regex                rss_marker_;
  std::chrono::milliseconds probe_timeout_;
  std::chrono::milliseconds request_timeout_;
  bool                      auto_mute_;
  std::size_t               max_error_body_bytes_;
};

} // namespace mirrorwatch::probe
