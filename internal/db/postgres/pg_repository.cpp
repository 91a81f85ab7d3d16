#include "pg_repository.hpp"

#include <string>

namespace mirrorwatch::db::postgres {

namespace {

constexpr const char* kInstanceColumns =
    "SELECT id,domain,url,country,is_additional,is_bad_host,enabled,missed_passes,created_at_ms,updated_at_ms FROM instances";

constexpr const char* kHealthCheckColumns =
    "SELECT h.instance_id,h.checked_at_ms,h.healthy,h.response_time_ms,h.http_status,h.version,h.version_url,"
    "h.is_upstream,h.is_latest_version,h.rss,h.connectivity FROM health_checks h";

model::InstanceRecord ReadInstance(const pqxx::row& row) {
  model::InstanceRecord r;
  r.id            = row[0].as<int64_t>();
  r.domain        = row[1].c_str();
  r.url           = row[2].c_str();
  r.country       = row[3].c_str();
  r.is_additional = row[4].as<bool>();
  r.is_bad_host   = row[5].as<bool>();
  r.enabled       = row[6].as<bool>();
  r.missed_passes = row[7].as<uint32_t>();
  r.created_at_ms = row[8].as<uint64_t>();
  r.updated_at_ms = row[9].as<uint64_t>();
  return r;
}

model::HealthCheckRecord ReadHealthCheck(const pqxx::row& row) {
  model::HealthCheckRecord r;
  r.instance_id   = row[0].as<int64_t>();
  r.checked_at_ms = row[1].as<uint64_t>();
  r.healthy       = row[2].as<bool>();
  if (!row[3].is_null()) r.response_time_ms = row[3].as<int64_t>();
  if (!row[4].is_null()) r.http_status = row[4].as<int32_t>();
  if (!row[5].is_null()) r.version = row[5].c_str();
  if (!row[6].is_null()) r.version_url = row[6].c_str();
  r.is_upstream       = row[7].as<bool>();
  r.is_latest_version = row[8].as<bool>();
  r.rss               = row[9].as<bool>();
  r.connectivity      = static_cast<mirrorwatch::v1::Connectivity>(row[10].as<int>());
  return r;
}

// Appends the time filter; instance-scoped ranges bind a third parameter.
std::string RangeClause(const char* column, const char* instance_column, const TimeRange& range) {
  std::string clause = std::string(" WHERE ") + column + ">=$1 AND " + column + "<$2";
  if (range.instance_id) clause += std::string(" AND ") + instance_column + "=$3";
  return clause;
}

pqxx::result ExecRange(pqxx::work& work, const std::string& query, const TimeRange& range) {
  if (range.instance_id) {
    return work.exec_params(query, static_cast<int64_t>(range.from_ms), static_cast<int64_t>(range.to_ms), *range.instance_id);
  }
  return work.exec_params(query, static_cast<int64_t>(range.from_ms), static_cast<int64_t>(range.to_ms));
}

std::optional<uint64_t> MaxOf(const pqxx::result& res) {
  if (res.empty() || res[0][0].is_null()) return std::nullopt;
  return res[0][0].as<uint64_t>();
}

} // namespace

PgRepository::PgRepository(std::shared_ptr<PgPool> pool) : pool_(std::move(pool)) {
}

std::unique_ptr<db::Transaction> PgRepository::Begin() {
  return std::make_unique<PgTransaction>(pool_);
}

PgTransaction& PgRepository::TX(Transaction& t) {
  return static_cast<PgTransaction&>(t);
}

Result PgRepository::Translate(const std::exception& e) {
  if (dynamic_cast<const pqxx::unique_violation*>(&e)) {
    return Result::Err(ErrorCode::AlreadyExists, e.what());
  }
  if (dynamic_cast<const pqxx::integrity_constraint_violation*>(&e)) {
    return Result::Err(ErrorCode::ConstraintViolation, e.what());
  }
  if (dynamic_cast<const pqxx::broken_connection*>(&e)) {
    return Result::Err(ErrorCode::IOError, e.what());
  }
  return Result::Err(ErrorCode::InternalError, e.what());
}

// ------------------------------------------------------------------
// Instances
// ------------------------------------------------------------------

Result PgRepository::InsertInstance(Transaction& t, model::InstanceRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared("insert_instance", r.domain, r.url, r.country, r.is_additional, r.is_bad_host, r.enabled,
                                          static_cast<int32_t>(r.missed_passes), static_cast<int64_t>(r.created_at_ms),
                                          static_cast<int64_t>(r.updated_at_ms));
    r.id = res[0][0].as<int64_t>();
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

Result PgRepository::UpdateInstance(Transaction& t, const model::InstanceRecord& r) {
  try {
    auto res = TX(t).Work().exec_prepared("update_instance", r.id, r.domain, r.url, r.country, r.is_additional, r.is_bad_host, r.enabled,
                                          static_cast<int32_t>(r.missed_passes), static_cast<int64_t>(r.updated_at_ms));
    if (res.affected_rows() == 0) return Result::Err(ErrorCode::NotFound);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::InstanceRecord> PgRepository::GetInstance(Transaction& t, int64_t id) {
  auto res = TX(t).Work().exec_params(std::string(kInstanceColumns) + " WHERE id=$1", id);
  if (res.empty()) return std::nullopt;
  return ReadInstance(res[0]);
}

std::optional<model::InstanceRecord> PgRepository::GetInstanceByDomain(Transaction& t, const std::string& domain) {
  auto res = TX(t).Work().exec_params(std::string(kInstanceColumns) + " WHERE domain=$1", domain);
  if (res.empty()) return std::nullopt;
  return ReadInstance(res[0]);
}

std::vector<model::InstanceRecord> PgRepository::ListInstances(Transaction& t, bool enabled_only) {
  std::string query = kInstanceColumns;
  if (enabled_only) query += " WHERE enabled";
  query += " ORDER BY id";

  auto                               res = TX(t).Work().exec(query);
  std::vector<model::InstanceRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(ReadInstance(row));
  return out;
}

// ------------------------------------------------------------------
// Health checks
// ------------------------------------------------------------------

Result PgRepository::InsertHealthCheck(Transaction& t, const model::HealthCheckRecord& r) {
  try {
    TX(t).Work().exec_prepared("insert_health_check", r.instance_id, static_cast<int64_t>(r.checked_at_ms), r.healthy, r.response_time_ms,
                               r.http_status, r.version, r.version_url, r.is_upstream, r.is_latest_version, r.rss,
                               static_cast<int>(r.connectivity));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::HealthCheckRecord> PgRepository::ListHealthChecks(Transaction& t, const TimeRange& range) {
  auto res = ExecRange(TX(t).Work(),
                       std::string(kHealthCheckColumns) + RangeClause("h.checked_at_ms", "h.instance_id", range) + " ORDER BY h.checked_at_ms ASC",
                       range);
  std::vector<model::HealthCheckRecord> out;
  out.reserve(res.size());
  for (const auto& row : res) out.push_back(ReadHealthCheck(row));
  return out;
}

std::vector<model::HealthCheckRecord> PgRepository::RecentHealthChecks(Transaction& t, int64_t instance_id, std::size_t limit) {
  auto res = TX(t).Work().exec_params(std::string(kHealthCheckColumns) + " WHERE h.instance_id=$1 ORDER BY h.checked_at_ms DESC LIMIT $2",
                                      instance_id, static_cast<int64_t>(limit));
  std::vector<model::HealthCheckRecord> out;
  for (const auto& row : res) out.push_back(ReadHealthCheck(row));
  return out;
}

std::vector<model::HealthCheckRecord> PgRepository::LatestHealthChecks(Transaction& t) {
  auto res = TX(t).Work().exec(std::string(kHealthCheckColumns) +
                               " JOIN (SELECT instance_id, MAX(checked_at_ms) AS last_at FROM health_checks GROUP BY instance_id) l"
                               " ON l.instance_id=h.instance_id AND l.last_at=h.checked_at_ms ORDER BY h.instance_id");
  std::vector<model::HealthCheckRecord> out;
  for (const auto& row : res) {
    auto record = ReadHealthCheck(row);
    if (!out.empty() && out.back().instance_id == record.instance_id) continue;
    out.push_back(std::move(record));
  }
  return out;
}

HealthCounts PgRepository::CountHealthChecks(Transaction& t, const TimeRange& range) {
  auto res = ExecRange(TX(t).Work(),
                       "SELECT COUNT(*), COALESCE(SUM(CASE WHEN healthy THEN 1 ELSE 0 END),0) FROM health_checks" +
                           RangeClause("checked_at_ms", "instance_id", range),
                       range);
  HealthCounts counts;
  if (!res.empty()) {
    counts.total   = res[0][0].as<uint64_t>();
    counts.healthy = res[0][1].as<uint64_t>();
  }
  return counts;
}

std::optional<uint64_t> PgRepository::LastHealthyAt(Transaction& t, int64_t instance_id) {
  return MaxOf(TX(t).Work().exec_params("SELECT MAX(checked_at_ms) FROM health_checks WHERE instance_id=$1 AND healthy", instance_id));
}

std::optional<uint64_t> PgRepository::LastHealthCheckAt(Transaction& t) {
  return MaxOf(TX(t).Work().exec("SELECT MAX(checked_at_ms) FROM health_checks"));
}

Result PgRepository::DeleteHealthChecksBefore(Transaction& t, uint64_t cutoff_ms) {
  try {
    TX(t).Work().exec_params("DELETE FROM health_checks WHERE checked_at_ms<$1", static_cast<int64_t>(cutoff_ms));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Error log
// ------------------------------------------------------------------

Result PgRepository::InsertError(Transaction& t, const model::ErrorRecord& r) {
  try {
    TX(t).Work().exec_prepared("insert_error", r.instance_id, static_cast<int64_t>(r.occurred_at_ms), static_cast<int>(r.category), r.message,
                               r.http_status, r.http_body);
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::ErrorRecord> PgRepository::ListErrors(Transaction& t, int64_t instance_id, std::size_t limit) {
  auto res = TX(t).Work().exec_params(
      "SELECT instance_id,occurred_at_ms,category,message,http_status,http_body FROM check_errors"
      " WHERE instance_id=$1 ORDER BY occurred_at_ms DESC, id DESC LIMIT $2",
      instance_id, static_cast<int64_t>(limit));

  std::vector<model::ErrorRecord> out;
  for (const auto& row : res) {
    model::ErrorRecord r;
    r.instance_id    = row[0].as<int64_t>();
    r.occurred_at_ms = row[1].as<uint64_t>();
    r.category       = static_cast<mirrorwatch::v1::ErrorCategory>(row[2].as<int>());
    r.message        = row[3].c_str();
    if (!row[4].is_null()) r.http_status = row[4].as<int32_t>();
    r.http_body = row[5].c_str();
    out.push_back(std::move(r));
  }
  return out;
}

std::size_t PgRepository::CountErrors(Transaction& t, int64_t instance_id) {
  auto res = TX(t).Work().exec_params("SELECT COUNT(*) FROM check_errors WHERE instance_id=$1", instance_id);
  return res.empty() ? 0 : res[0][0].as<std::size_t>();
}

Result PgRepository::TrimErrors(Transaction& t, int64_t instance_id, std::size_t keep) {
  try {
    TX(t).Work().exec_prepared("trim_errors", instance_id, static_cast<int64_t>(keep));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

// ------------------------------------------------------------------
// Stats snapshots
// ------------------------------------------------------------------

Result PgRepository::InsertStatsSnapshot(Transaction& t, const model::StatsSnapshotRecord& r) {
  try {
    for (const auto& [counter, value] : r.counters) {
      TX(t).Work().exec_prepared("insert_stats_counter", r.instance_id, static_cast<int64_t>(r.collected_at_ms), counter, value);
    }
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::vector<model::StatsSnapshotRecord> PgRepository::ListStatsSnapshots(Transaction& t, const TimeRange& range) {
  auto res = ExecRange(TX(t).Work(),
                       "SELECT instance_id,collected_at_ms,counter,value FROM instance_stats" + RangeClause("collected_at_ms", "instance_id", range) +
                           " ORDER BY collected_at_ms ASC, instance_id ASC",
                       range);

  std::vector<model::StatsSnapshotRecord> out;
  for (const auto& row : res) {
    const auto instance_id = row[0].as<int64_t>();
    const auto at          = row[1].as<uint64_t>();
    if (out.empty() || out.back().instance_id != instance_id || out.back().collected_at_ms != at) {
      out.push_back({instance_id, at, {}});
    }
    out.back().counters[row[2].c_str()] = row[3].as<int64_t>();
  }
  return out;
}

std::optional<uint64_t> PgRepository::LastStatsAt(Transaction& t) {
  return MaxOf(TX(t).Work().exec("SELECT MAX(collected_at_ms) FROM instance_stats"));
}

// ------------------------------------------------------------------
// Upstream version
// ------------------------------------------------------------------

Result PgRepository::SaveUpstreamVersion(Transaction& t, const model::UpstreamVersionRecord& r) {
  try {
    TX(t).Work().exec_prepared("upsert_upstream_version", r.commit, r.branch, static_cast<int64_t>(r.refreshed_at_ms));
    return Result::Ok();
  } catch (const std::exception& e) {
    return Translate(e);
  }
}

std::optional<model::UpstreamVersionRecord> PgRepository::GetUpstreamVersion(Transaction& t) {
  auto res = TX(t).Work().exec("SELECT commit_sha,branch,refreshed_at_ms FROM upstream_version WHERE id=1");
  if (res.empty()) return std::nullopt;

  model::UpstreamVersionRecord r;
  r.commit          = res[0][0].c_str();
  r.branch          = res[0][1].c_str();
  r.refreshed_at_ms = res[0][2].as<uint64_t>();
  return r;
}

} // namespace mirrorwatch::db::postgres
