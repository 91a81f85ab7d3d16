#include "scoring_engine.hpp"

#include <algorithm>
#include <cmath>

#include "internal/util/strings.hpp"
#include "internal/util/time.hpp"

namespace mirrorwatch::scoring {

namespace {

constexpr uint64_t kMonthMs = 30 * util::kMillisPerDay;
constexpr uint64_t kLongMs  = 120 * util::kMillisPerDay;

std::optional<double> Ratio(const db::HealthCounts& counts) {
  if (counts.total == 0) return std::nullopt;
  return static_cast<double>(counts.healthy) / static_cast<double>(counts.total);
}

std::optional<double> Percent(const std::optional<double>& ratio) {
  if (!ratio) return std::nullopt;
  return *ratio * 100.0;
}

db::HealthCounts Window(db::Repository& repository, db::Transaction& tx, int64_t instance_id, uint64_t now_ms, uint64_t span_ms) {
  db::TimeRange range;
  range.from_ms     = now_ms > span_ms ? now_ms - span_ms : 0;
  range.to_ms       = now_ms + 1;
  range.instance_id = instance_id;
  return repository.CountHealthChecks(tx, range);
}

} // namespace

double VersionCredit(bool is_upstream, bool is_latest_version) {
  if (is_upstream && is_latest_version) return 1.0;
  if (is_upstream) return 0.5;
  return 0.0;
}

int64_t ComputePoints(const WindowRatios& ratios, double version_credit, const ScoringWeights& weights) {
  const double recent = ratios.recent.value_or(0.0);
  const double sum    = weights.recent * recent + weights.month * ratios.month.value_or(0.0) +
                     weights.long_term * ratios.long_term.value_or(0.0) + weights.version * version_credit;
  const double scale = weights.scale_by_recent ? recent : 1.0;
  return static_cast<int64_t>(std::llround(100.0 * scale * sum));
}

ScoringEngine::ScoringEngine(const mirrorwatch::runtime::config::RuntimeConfig& config)
    : recent_window_ms_(config.scoring().recent_window_hours() * util::kMillisPerHour),
      ping_range_ms_(config.scoring().ping_range_hours() * util::kMillisPerHour),
      recent_checks_(config.scoring().recent_checks()),
      upstream_web_url_(config.upstream().web_url()) {
  const auto& scoring = config.scoring();
  if (scoring.has_weight_recent()) weights_.recent = scoring.weight_recent();
  if (scoring.has_weight_month()) weights_.month = scoring.weight_month();
  if (scoring.has_weight_long()) weights_.long_term = scoring.weight_long();
  if (scoring.has_weight_version()) weights_.version = scoring.weight_version();
  if (scoring.has_scale_by_recent()) weights_.scale_by_recent = scoring.scale_by_recent();
}

InstanceScore ScoringEngine::Score(db::Repository& repository, db::Transaction& tx, const db::model::InstanceRecord& instance,
                                   uint64_t now_ms) const {
  InstanceScore score;
  score.instance = instance;

  auto recent = repository.RecentHealthChecks(tx, instance.id, std::max<std::size_t>(recent_checks_, 1));
  if (!recent.empty()) {
    score.latest      = recent.front();
    score.healthy_now = recent.front().healthy;
  }
  std::reverse(recent.begin(), recent.end());
  if (recent.size() > recent_checks_) recent.erase(recent.begin(), recent.end() - static_cast<std::ptrdiff_t>(recent_checks_));
  score.recent_checks = std::move(recent);

  score.last_healthy_ms    = repository.LastHealthyAt(tx, instance.id);
  score.never_seen_healthy = !score.last_healthy_ms.has_value();

  // Response times of healthy checks inside the ping range.
  db::TimeRange pings;
  pings.from_ms     = now_ms > ping_range_ms_ ? now_ms - ping_range_ms_ : 0;
  pings.to_ms       = now_ms + 1;
  pings.instance_id = instance.id;

  int64_t sum     = 0;
  int64_t samples = 0;
  for (const auto& check : repository.ListHealthChecks(tx, pings)) {
    if (!check.healthy || !check.response_time_ms) continue;
    const auto ms = *check.response_time_ms;
    sum += ms;
    ++samples;
    score.min_response_ms = score.min_response_ms ? std::min(*score.min_response_ms, ms) : ms;
    score.max_response_ms = score.max_response_ms ? std::max(*score.max_response_ms, ms) : ms;
  }
  if (samples > 0) score.avg_response_ms = sum / samples;

  WindowRatios ratios;
  ratios.recent    = Ratio(Window(repository, tx, instance.id, now_ms, recent_window_ms_));
  ratios.month     = Ratio(Window(repository, tx, instance.id, now_ms, kMonthMs));
  ratios.long_term = Ratio(Window(repository, tx, instance.id, now_ms, kLongMs));

  score.pct_recent  = Percent(ratios.recent);
  score.pct_30d     = Percent(ratios.month);
  score.pct_120d    = Percent(ratios.long_term);
  score.overall_pct = Percent(Ratio(Window(repository, tx, instance.id, now_ms, now_ms)));

  const bool is_upstream = score.latest && score.latest->is_upstream;
  const bool is_latest   = score.latest && score.latest->is_latest_version;
  score.points           = ComputePoints(ratios, VersionCredit(is_upstream, is_latest), weights_);

  if (is_latest) {
    score.commit_status = v1::COMMIT_STATUS_CURRENT;
  } else if (is_upstream) {
    score.commit_status = v1::COMMIT_STATUS_OUTDATED;
  } else if (score.latest && score.latest->version_url && !upstream_web_url_.empty() &&
             !util::IStartsWith(*score.latest->version_url, upstream_web_url_)) {
    score.commit_status = v1::COMMIT_STATUS_CUSTOM_BRANCH;
  }

  return score;
}

std::vector<InstanceScore> ScoringEngine::ScoreAll(db::Repository& repository, db::Transaction& tx,
                                                   const std::vector<db::model::InstanceRecord>& instances, uint64_t now_ms) const {
  std::vector<InstanceScore> scores;
  scores.reserve(instances.size());
  for (const auto& instance : instances) {
    scores.push_back(Score(repository, tx, instance, now_ms));
  }
  Rank(scores);
  return scores;
}

void Rank(std::vector<InstanceScore>& scores) {
  auto bad = std::stable_partition(scores.begin(), scores.end(), [](const InstanceScore& s) { return !s.instance.is_bad_host; });

  std::stable_sort(scores.begin(), bad, [](const InstanceScore& a, const InstanceScore& b) {
    const bool a_scored = a.points > 0;
    const bool b_scored = b.points > 0;
    if (a_scored != b_scored) return a_scored;

    if (a_scored) {
      if (a.points != b.points) return a.points > b.points;
      return a.overall_pct.value_or(0.0) > b.overall_pct.value_or(0.0);
    }

    if (a.last_healthy_ms.has_value() != b.last_healthy_ms.has_value()) return a.last_healthy_ms.has_value();
    return a.last_healthy_ms.value_or(0) > b.last_healthy_ms.value_or(0);
  });

  uint32_t rank = 0;
  for (auto it = scores.begin(); it != scores.end(); ++it) {
    it->rank = it < bad ? ++rank : 0;
  }
}

} // namespace mirrorwatch::scoring
