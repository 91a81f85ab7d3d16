#include "memory_repository.hpp"

#include <algorithm>

#include "memory_tx.hpp"

namespace mirrorwatch::db::memory {

namespace {

// Clones a history the first time a transaction writes to it.
template <typename T>
T& Writable(std::shared_ptr<T>& ptr) {
  if (!ptr) {
    ptr = std::make_shared<T>();
  } else if (ptr.use_count() > 1) {
    ptr = std::make_shared<T>(*ptr);
  }
  return *ptr;
}

bool InRange(const TimeRange& range, int64_t instance_id, uint64_t at_ms) {
  if (range.instance_id && *range.instance_id != instance_id) return false;
  return at_ms >= range.from_ms && at_ms < range.to_ms;
}

} // namespace

MemoryRepository::MemoryRepository() = default;

std::unique_ptr<db::Transaction> MemoryRepository::Begin() {
  return std::make_unique<MemoryTransaction>(*this);
}

static MemoryTransaction& TX(db::Transaction& tx) {
  return static_cast<MemoryTransaction&>(tx);
}

// ------------------------------------------------------------------
// Instances
// ------------------------------------------------------------------

Result MemoryRepository::InsertInstance(Transaction& t, model::InstanceRecord& r) {
  auto& s = TX(t).Mutable();
  if (s.domain_to_id.contains(r.domain)) return Result::Err(ErrorCode::AlreadyExists, r.domain);
  r.id                    = s.next_instance_id++;
  s.instances[r.id]       = r;
  s.domain_to_id[r.domain] = r.id;
  return Result::Ok();
}

Result MemoryRepository::UpdateInstance(Transaction& t, const model::InstanceRecord& r) {
  auto& s  = TX(t).Mutable();
  auto  it = s.instances.find(r.id);
  if (it == s.instances.end()) return Result::Err(ErrorCode::NotFound);
  if (it->second.domain != r.domain) {
    auto owner = s.domain_to_id.find(r.domain);
    if (owner != s.domain_to_id.end() && owner->second != r.id) return Result::Err(ErrorCode::ConstraintViolation, r.domain);
    s.domain_to_id.erase(it->second.domain);
    s.domain_to_id[r.domain] = r.id;
  }
  it->second = r;
  return Result::Ok();
}

std::optional<model::InstanceRecord> MemoryRepository::GetInstance(Transaction& t, int64_t id) {
  const auto& s  = TX(t).View();
  auto        it = s.instances.find(id);
  if (it == s.instances.end()) return std::nullopt;
  return it->second;
}

std::optional<model::InstanceRecord> MemoryRepository::GetInstanceByDomain(Transaction& t, const std::string& domain) {
  const auto& s  = TX(t).View();
  auto        it = s.domain_to_id.find(domain);
  if (it == s.domain_to_id.end()) return std::nullopt;
  return s.instances.at(it->second);
}

std::vector<model::InstanceRecord> MemoryRepository::ListInstances(Transaction& t, bool enabled_only) {
  std::vector<model::InstanceRecord> out;
  for (const auto& [_, record] : TX(t).View().instances) {
    if (enabled_only && !record.enabled) continue;
    out.push_back(record);
  }
  return out;
}

// ------------------------------------------------------------------
// Health checks
// ------------------------------------------------------------------

Result MemoryRepository::InsertHealthCheck(Transaction& t, const model::HealthCheckRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.instances.contains(r.instance_id)) return Result::Err(ErrorCode::ConstraintViolation, "unknown instance");

  auto& history = Writable(s.health_checks[r.instance_id]);
  auto  pos     = std::upper_bound(history.begin(), history.end(), r.checked_at_ms,
                                   [](uint64_t at, const model::HealthCheckRecord& e) { return at < e.checked_at_ms; });
  history.insert(pos, r);
  return Result::Ok();
}

std::vector<model::HealthCheckRecord> MemoryRepository::ListHealthChecks(Transaction& t, const TimeRange& range) {
  std::vector<model::HealthCheckRecord> out;
  for (const auto& [id, history] : TX(t).View().health_checks) {
    for (const auto& check : *history) {
      if (InRange(range, id, check.checked_at_ms)) out.push_back(check);
    }
  }
  std::stable_sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.checked_at_ms < b.checked_at_ms; });
  return out;
}

std::vector<model::HealthCheckRecord> MemoryRepository::RecentHealthChecks(Transaction& t, int64_t instance_id, std::size_t limit) {
  const auto& s  = TX(t).View();
  auto        it = s.health_checks.find(instance_id);
  if (it == s.health_checks.end()) return {};

  std::vector<model::HealthCheckRecord> out;
  for (auto r = it->second->rbegin(); r != it->second->rend() && out.size() < limit; ++r) {
    out.push_back(*r);
  }
  return out;
}

std::vector<model::HealthCheckRecord> MemoryRepository::LatestHealthChecks(Transaction& t) {
  std::vector<model::HealthCheckRecord> out;
  for (const auto& [_, history] : TX(t).View().health_checks) {
    if (!history->empty()) out.push_back(history->back());
  }
  return out;
}

HealthCounts MemoryRepository::CountHealthChecks(Transaction& t, const TimeRange& range) {
  HealthCounts counts;
  for (const auto& [id, history] : TX(t).View().health_checks) {
    if (range.instance_id && *range.instance_id != id) continue;
    for (const auto& check : *history) {
      if (!InRange(range, id, check.checked_at_ms)) continue;
      ++counts.total;
      if (check.healthy) ++counts.healthy;
    }
  }
  return counts;
}

std::optional<uint64_t> MemoryRepository::LastHealthyAt(Transaction& t, int64_t instance_id) {
  const auto& s  = TX(t).View();
  auto        it = s.health_checks.find(instance_id);
  if (it == s.health_checks.end()) return std::nullopt;
  for (auto r = it->second->rbegin(); r != it->second->rend(); ++r) {
    if (r->healthy) return r->checked_at_ms;
  }
  return std::nullopt;
}

std::optional<uint64_t> MemoryRepository::LastHealthCheckAt(Transaction& t) {
  std::optional<uint64_t> last;
  for (const auto& [_, history] : TX(t).View().health_checks) {
    if (history->empty()) continue;
    if (!last || history->back().checked_at_ms > *last) last = history->back().checked_at_ms;
  }
  return last;
}

Result MemoryRepository::DeleteHealthChecksBefore(Transaction& t, uint64_t cutoff_ms) {
  for (auto& [_, ptr] : TX(t).Mutable().health_checks) {
    if (ptr->empty() || ptr->front().checked_at_ms >= cutoff_ms) continue;
    auto& history = Writable(ptr);
    auto  keep    = std::lower_bound(history.begin(), history.end(), cutoff_ms,
                                     [](const model::HealthCheckRecord& e, uint64_t at) { return e.checked_at_ms < at; });
    history.erase(history.begin(), keep);
  }
  return Result::Ok();
}

// ------------------------------------------------------------------
// Error log
// ------------------------------------------------------------------

Result MemoryRepository::InsertError(Transaction& t, const model::ErrorRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.instances.contains(r.instance_id)) return Result::Err(ErrorCode::ConstraintViolation, "unknown instance");

  auto& log = Writable(s.errors[r.instance_id]);
  auto  pos = std::upper_bound(log.begin(), log.end(), r.occurred_at_ms,
                               [](uint64_t at, const model::ErrorRecord& e) { return at < e.occurred_at_ms; });
  log.insert(pos, r);
  return Result::Ok();
}

std::vector<model::ErrorRecord> MemoryRepository::ListErrors(Transaction& t, int64_t instance_id, std::size_t limit) {
  const auto& s  = TX(t).View();
  auto        it = s.errors.find(instance_id);
  if (it == s.errors.end()) return {};

  std::vector<model::ErrorRecord> out;
  for (auto r = it->second->rbegin(); r != it->second->rend() && out.size() < limit; ++r) {
    out.push_back(*r);
  }
  return out;
}

std::size_t MemoryRepository::CountErrors(Transaction& t, int64_t instance_id) {
  const auto& s  = TX(t).View();
  auto        it = s.errors.find(instance_id);
  return it == s.errors.end() ? 0 : it->second->size();
}

Result MemoryRepository::TrimErrors(Transaction& t, int64_t instance_id, std::size_t keep) {
  auto& s  = TX(t).Mutable();
  auto  it = s.errors.find(instance_id);
  if (it == s.errors.end() || it->second->size() <= keep) return Result::Ok();

  auto& log = Writable(it->second);
  while (log.size() > keep) log.pop_front(); // oldest first
  return Result::Ok();
}

// ------------------------------------------------------------------
// Stats snapshots
// ------------------------------------------------------------------

Result MemoryRepository::InsertStatsSnapshot(Transaction& t, const model::StatsSnapshotRecord& r) {
  auto& s = TX(t).Mutable();
  if (!s.instances.contains(r.instance_id)) return Result::Err(ErrorCode::ConstraintViolation, "unknown instance");
  Writable(s.stats).push_back(r);
  return Result::Ok();
}

std::vector<model::StatsSnapshotRecord> MemoryRepository::ListStatsSnapshots(Transaction& t, const TimeRange& range) {
  std::vector<model::StatsSnapshotRecord> out;
  const auto&                             s = TX(t).View();
  if (!s.stats) return out;
  for (const auto& snapshot : *s.stats) {
    if (InRange(range, snapshot.instance_id, snapshot.collected_at_ms)) out.push_back(snapshot);
  }
  std::stable_sort(out.begin(), out.end(), [](const auto& a, const auto& b) { return a.collected_at_ms < b.collected_at_ms; });
  return out;
}

std::optional<uint64_t> MemoryRepository::LastStatsAt(Transaction& t) {
  const auto& s = TX(t).View();
  if (!s.stats || s.stats->empty()) return std::nullopt;
  uint64_t last = 0;
  for (const auto& snapshot : *s.stats) last = std::max(last, snapshot.collected_at_ms);
  return last;
}

// ------------------------------------------------------------------
// Upstream version
// ------------------------------------------------------------------

Result MemoryRepository::SaveUpstreamVersion(Transaction& t, const model::UpstreamVersionRecord& r) {
  TX(t).Mutable().upstream = r;
  return Result::Ok();
}

std::optional<model::UpstreamVersionRecord> MemoryRepository::GetUpstreamVersion(Transaction& t) {
  return TX(t).View().upstream;
}

} // namespace mirrorwatch::db::memory
