#pragma once

#include <cstdint>
#include <optional>
#include <vector>

#include "config/config.pb.h"
#include "internal/db/api/repository.hpp"
#include "internal/upstream/version_oracle.hpp"

namespace mirrorwatch::scoring {

// Availability ratios in [0,1] per window; undefined windows are nullopt.
struct WindowRatios {
  std::optional<double> recent;
  std::optional<double> month;
  std::optional<double> long_term;
};

struct ScoringWeights {
  double recent          = 0.3;
  double month           = 0.2;
  double long_term       = 0.2;
  double version         = 0.1;
  bool   scale_by_recent = true;
};

// 1 for the latest upstream commit, 0.5 for an outdated upstream commit,
// 0 otherwise.
double VersionCredit(bool is_upstream, bool is_latest_version);

// round(100 * s * (wr*r + wm*m + wl*l + wv*v)); undefined ratios count as 0
// and s is the recent ratio when scale_by_recent is set.
int64_t ComputePoints(const WindowRatios& ratios, double version_credit, const ScoringWeights& weights);

struct InstanceScore {
  db::model::InstanceRecord instance;

  bool                                        healthy_now = false;
  std::optional<db::model::HealthCheckRecord> latest;
  std::optional<uint64_t>                     last_healthy_ms;
  bool                                        never_seen_healthy = true;

  std::optional<int64_t> avg_response_ms;
  std::optional<int64_t> min_response_ms;
  std::optional<int64_t> max_response_ms;

  // percentages in [0,100]
  std::optional<double> pct_recent;
  std::optional<double> pct_30d;
  std::optional<double> pct_120d;
  std::optional<double> overall_pct;

  int64_t  points = 0;
  uint32_t rank   = 0;

  v1::CommitStatus commit_status = v1::COMMIT_STATUS_UNKNOWN;

  // oldest first
  std::vector<db::model::HealthCheckRecord> recent_checks;
};

/*
  Scoring Engine.

  Derives windowed availability and a single sortable score per instance
  from stored health history. Read-only; callers pass the transaction so
  a whole fleet is scored against one consistent view.
*/
class ScoringEngine {
 public:
  explicit ScoringEngine(const mirrorwatch::runtime::config::RuntimeConfig& config);

  InstanceScore Score(db::Repository& repository, db::Transaction& tx, const db::model::InstanceRecord& instance, uint64_t now_ms) const;

  std::vector<InstanceScore> ScoreAll(db::Repository& repository, db::Transaction& tx, const std::vector<db::model::InstanceRecord>& instances,
                                      uint64_t now_ms) const;

  const ScoringWeights& Weights() const {
    return weights_;
  }

 private:
  ScoringWeights weights_;
  uint64_t       recent_window_ms_;
  uint64_t       ping_range_ms_;
  std::size_t    recent_checks_;
  std::string    upstream_web_url_;
};

// Orders by points (desc) then overall percentage (desc); instances without
// points follow, most recently healthy first. Bad hosts are left unranked
// at the end. Assigns 1-based ranks.
void Rank(std::vector<InstanceScore>& scores);

} // namespace mirrorwatch::scoring
