#pragma once

#include <string>
#include <unordered_map>
#include <vector>

#include "config/config.pb.h"
#include "internal/db/model/instance_record.hpp"

namespace mirrorwatch::probe {

// Endpoints of one instance after applying its override, if any.
struct InstanceEndpoints {
  std::string profile_path;
  std::string rss_path;
  std::string about_path;
  std::string stats_path;
  std::string stats_query;
  std::string bearer_token;
};

class OverrideTable {
 public:
  explicit OverrideTable(const mirrorwatch::runtime::config::RuntimeConfig& config);

  InstanceEndpoints Resolve(const std::string& domain) const;

  // Logs overrides whose domain is not among `instances`.
  void WarnUnmatched(const std::vector<db::model::InstanceRecord>& instances) const;

 private:
  InstanceEndpoints                                                           defaults_;
  std::unordered_map<std::string, mirrorwatch::runtime::config::InstanceOverride> overrides_;
};

} // namespace mirrorwatch::probe
