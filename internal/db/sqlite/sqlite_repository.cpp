#include "sqlite_repository.hpp"

#include <sqlite3.h>

#include <string>

#include "internal/db/sql/sql_queries.hpp"
#include "internal/util/errors.hpp"

namespace mirrorwatch::db::sqlite {

namespace {

// Prepared statement finalized on scope exit.
class Statement {
 public:
  Statement(sqlite3* db, const std::string& sql) : db_(db) {
    rc_ = sqlite3_prepare_v2(db, sql.c_str(), -1, &st_, nullptr);
  }
  ~Statement() {
    if (st_) sqlite3_finalize(st_);
  }

  Statement(const Statement&)            = delete;
  Statement& operator=(const Statement&) = delete;

  bool Ok() const {
    return rc_ == SQLITE_OK && st_ != nullptr;
  }
  int PrepareCode() const {
    return rc_;
  }
  sqlite3_stmt* Get() const {
    return st_;
  }
  int Step() {
    return sqlite3_step(st_);
  }

  // Readers have no Result channel: a statement that does not prepare is a
  // schema problem, surfaced as StorageError.
  void Require() const {
    if (!Ok()) throw util::StorageError(std::string("sqlite prepare: ") + sqlite3_errmsg(db_));
  }

 private:
  sqlite3*      db_ = nullptr;
  sqlite3_stmt* st_ = nullptr;
  int           rc_ = SQLITE_OK;
};

void BindText(sqlite3_stmt* st, int idx, const std::string& s) {
  sqlite3_bind_text(st, idx, s.c_str(), -1, SQLITE_TRANSIENT);
}

void BindI64(sqlite3_stmt* st, int idx, int64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindU64(sqlite3_stmt* st, int idx, uint64_t v) {
  sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(v));
}

void BindBool(sqlite3_stmt* st, int idx, bool v) {
  sqlite3_bind_int(st, idx, v ? 1 : 0);
}

template <typename T>
void BindOptInt(sqlite3_stmt* st, int idx, const std::optional<T>& v) {
  if (v) {
    sqlite3_bind_int64(st, idx, static_cast<sqlite3_int64>(*v));
  } else {
    sqlite3_bind_null(st, idx);
  }
}

void BindOptText(sqlite3_stmt* st, int idx, const std::optional<std::string>& v) {
  if (v) {
    BindText(st, idx, *v);
  } else {
    sqlite3_bind_null(st, idx);
  }
}

std::string ColText(sqlite3_stmt* st, int col) {
  const unsigned char* t = sqlite3_column_text(st, col);
  return t ? reinterpret_cast<const char*>(t) : "";
}

int64_t ColI64(sqlite3_stmt* st, int col) {
  return static_cast<int64_t>(sqlite3_column_int64(st, col));
}

uint64_t ColU64(sqlite3_stmt* st, int col) {
  return static_cast<uint64_t>(sqlite3_column_int64(st, col));
}

bool ColBool(sqlite3_stmt* st, int col) {
  return sqlite3_column_int(st, col) != 0;
}

bool IsNull(sqlite3_stmt* st, int col) {
  return sqlite3_column_type(st, col) == SQLITE_NULL;
}

std::optional<std::string> ColOptText(sqlite3_stmt* st, int col) {
  if (IsNull(st, col)) return std::nullopt;
  return ColText(st, col);
}

model::InstanceRecord ReadInstance(sqlite3_stmt* st) {
  model::InstanceRecord r;
  r.id            = ColI64(st, 0);
  r.domain        = ColText(st, 1);
  r.url           = ColText(st, 2);
  r.country       = ColText(st, 3);
  r.is_additional = ColBool(st, 4);
  r.is_bad_host   = ColBool(st, 5);
  r.enabled       = ColBool(st, 6);
  r.missed_passes = static_cast<uint32_t>(sqlite3_column_int(st, 7));
  r.created_at_ms = ColU64(st, 8);
  r.updated_at_ms = ColU64(st, 9);
  return r;
}

model::HealthCheckRecord ReadHealthCheck(sqlite3_stmt* st) {
  model::HealthCheckRecord r;
  r.instance_id   = ColI64(st, 0);
  r.checked_at_ms = ColU64(st, 1);
  r.healthy       = ColBool(st, 2);
  if (!IsNull(st, 3)) r.response_time_ms = ColI64(st, 3);
  if (!IsNull(st, 4)) r.http_status = sqlite3_column_int(st, 4);
  r.version           = ColOptText(st, 5);
  r.version_url       = ColOptText(st, 6);
  r.is_upstream       = ColBool(st, 7);
  r.is_latest_version = ColBool(st, 8);
  r.rss               = ColBool(st, 9);
  r.connectivity      = static_cast<mirrorwatch::v1::Connectivity>(sqlite3_column_int(st, 10));
  return r;
}

model::ErrorRecord ReadError(sqlite3_stmt* st) {
  model::ErrorRecord r;
  r.instance_id    = ColI64(st, 0);
  r.occurred_at_ms = ColU64(st, 1);
  r.category       = static_cast<mirrorwatch::v1::ErrorCategory>(sqlite3_column_int(st, 2));
  r.message        = ColText(st, 3);
  if (!IsNull(st, 4)) r.http_status = sqlite3_column_int(st, 4);
  r.http_body = ColText(st, 5);
  return r;
}

std::string RangeClause(const char* column, const char* instance_column, const TimeRange& range) {
  std::string clause = std::string(" WHERE ") + column + ">=? AND " + column + "<?";
  if (range.instance_id) clause += std::string(" AND ") + instance_column + "=?";
  return clause;
}

void BindRange(sqlite3_stmt* st, const TimeRange& range) {
  BindU64(st, 1, range.from_ms);
  BindU64(st, 2, range.to_ms);
  if (range.instance_id) BindI64(st, 3, *range.instance_id);
}

std::optional<uint64_t> ScalarMax(sqlite3* db, const std::string& sql, std::optional<int64_t> instance_id = std::nullopt) {
  Statement st(db, sql);
  st.Require();
  if (instance_id) BindI64(st.Get(), 1, *instance_id);
  if (st.Step() != SQLITE_ROW || IsNull(st.Get(), 0)) return std::nullopt;
  return ColU64(st.Get(), 0);
}

} // namespace

SqliteRepository::SqliteRepository(std::shared_ptr<SqliteDB> db) : db_(std::move(db)) {
}

std::unique_ptr<db::Transaction> SqliteRepository::Begin() {
  return std::make_unique<SqliteTransaction>(db_);
}

SqliteTransaction& SqliteRepository::TX(Transaction& t) {
  return static_cast<SqliteTransaction&>(t);
}

Result SqliteRepository::Translate(sqlite3* db, int rc) {
  if (rc == SQLITE_OK || rc == SQLITE_DONE || rc == SQLITE_ROW) return Result::Ok();

  switch (rc & 0xFF) {
    case SQLITE_BUSY:
    case SQLITE_LOCKED:
      return Result::Err(ErrorCode::Busy, sqlite3_errmsg(db));
    case SQLITE_CONSTRAINT:
      return Result::Err(ErrorCode::ConstraintViolation, sqlite3_errmsg(db));
    case SQLITE_IOERR:
      return Result::Err(ErrorCode::IOError, sqlite3_errmsg(db));
    case SQLITE_CORRUPT:
      return Result::Err(ErrorCode::Corruption, sqlite3_errmsg(db));
    default:
      return Result::Err(ErrorCode::InternalError, sqlite3_errmsg(db));
  }
}

// ------------------------------------------------------------------
// Instances
// ------------------------------------------------------------------

Result SqliteRepository::InsertInstance(Transaction& t, model::InstanceRecord& r) {
  auto*     db = TX(t).Handle();
  Statement st(db, sql::INSERT_INSTANCE);
  if (!st.Ok()) return Translate(db, st.PrepareCode());

  BindText(st.Get(), 1, r.domain);
  BindText(st.Get(), 2, r.url);
  BindText(st.Get(), 3, r.country);
  BindBool(st.Get(), 4, r.is_additional);
  BindBool(st.Get(), 5, r.is_bad_host);
  BindBool(st.Get(), 6, r.enabled);
  BindI64(st.Get(), 7, r.missed_passes);
  BindU64(st.Get(), 8, r.created_at_ms);
  BindU64(st.Get(), 9, r.updated_at_ms);

  const int rc = st.Step();
  if (rc == SQLITE_CONSTRAINT || (rc & 0xFF) == SQLITE_CONSTRAINT) {
    return Result::Err(ErrorCode::AlreadyExists, r.domain);
  }
  auto result = Translate(db, rc);
  if (result) r.id = sqlite3_last_insert_rowid(db);
  return result;
}

Result SqliteRepository::UpdateInstance(Transaction& t, const model::InstanceRecord& r) {
  auto*     db = TX(t).Handle();
  Statement st(db, sql::UPDATE_INSTANCE);
  if (!st.Ok()) return Translate(db, st.PrepareCode());

  BindText(st.Get(), 1, r.domain);
  BindText(st.Get(), 2, r.url);
  BindText(st.Get(), 3, r.country);
  BindBool(st.Get(), 4, r.is_additional);
  BindBool(st.Get(), 5, r.is_bad_host);
  BindBool(st.Get(), 6, r.enabled);
  BindI64(st.Get(), 7, r.missed_passes);
  BindU64(st.Get(), 8, r.updated_at_ms);
  BindI64(st.Get(), 9, r.id);

  auto result = Translate(db, st.Step());
  if (result && sqlite3_changes(db) == 0) return Result::Err(ErrorCode::NotFound);
  return result;
}

std::optional<model::InstanceRecord> SqliteRepository::GetInstance(Transaction& t, int64_t id) {
  Statement st(TX(t).Handle(), std::string(sql::INSTANCE_COLUMNS) + " WHERE id=?;");
  st.Require();
  BindI64(st.Get(), 1, id);
  if (st.Step() != SQLITE_ROW) return std::nullopt;
  return ReadInstance(st.Get());
}

std::optional<model::InstanceRecord> SqliteRepository::GetInstanceByDomain(Transaction& t, const std::string& domain) {
  Statement st(TX(t).Handle(), std::string(sql::INSTANCE_COLUMNS) + " WHERE domain=?;");
  st.Require();
  BindText(st.Get(), 1, domain);
  if (st.Step() != SQLITE_ROW) return std::nullopt;
  return ReadInstance(st.Get());
}

std::vector<model::InstanceRecord> SqliteRepository::ListInstances(Transaction& t, bool enabled_only) {
  std::string q = sql::INSTANCE_COLUMNS;
  if (enabled_only) q += " WHERE enabled<>0";
  q += " ORDER BY id;";

  Statement st(TX(t).Handle(), q);
  st.Require();
  std::vector<model::InstanceRecord> out;
  while (st.Step() == SQLITE_ROW) out.push_back(ReadInstance(st.Get()));
  return out;
}

// ------------------------------------------------------------------
// Health checks
// ------------------------------------------------------------------

Result SqliteRepository::InsertHealthCheck(Transaction& t, const model::HealthCheckRecord& r) {
  auto*     db = TX(t).Handle();
  Statement st(db, sql::INSERT_HEALTH_CHECK);
  if (!st.Ok()) return Translate(db, st.PrepareCode());

  BindI64(st.Get(), 1, r.instance_id);
  BindU64(st.Get(), 2, r.checked_at_ms);
  BindBool(st.Get(), 3, r.healthy);
  BindOptInt(st.Get(), 4, r.response_time_ms);
  BindOptInt(st.Get(), 5, r.http_status);
  BindOptText(st.Get(), 6, r.version);
  BindOptText(st.Get(), 7, r.version_url);
  BindBool(st.Get(), 8, r.is_upstream);
  BindBool(st.Get(), 9, r.is_latest_version);
  BindBool(st.Get(), 10, r.rss);
  sqlite3_bind_int(st.Get(), 11, static_cast<int>(r.connectivity));

  return Translate(db, st.Step());
}

std::vector<model::HealthCheckRecord> SqliteRepository::ListHealthChecks(Transaction& t, const TimeRange& range) {
  Statement st(TX(t).Handle(),
               std::string(sql::HEALTH_CHECK_COLUMNS) + RangeClause("h.checked_at_ms", "h.instance_id", range) + " ORDER BY h.checked_at_ms ASC;");
  st.Require();
  BindRange(st.Get(), range);

  std::vector<model::HealthCheckRecord> out;
  while (st.Step() == SQLITE_ROW) out.push_back(ReadHealthCheck(st.Get()));
  return out;
}

std::vector<model::HealthCheckRecord> SqliteRepository::RecentHealthChecks(Transaction& t, int64_t instance_id, std::size_t limit) {
  Statement st(TX(t).Handle(), std::string(sql::HEALTH_CHECK_COLUMNS) + " WHERE h.instance_id=? ORDER BY h.checked_at_ms DESC LIMIT ?;");
  st.Require();
  BindI64(st.Get(), 1, instance_id);
  BindU64(st.Get(), 2, limit);

  std::vector<model::HealthCheckRecord> out;
  while (st.Step() == SQLITE_ROW) out.push_back(ReadHealthCheck(st.Get()));
  return out;
}

std::vector<model::HealthCheckRecord> SqliteRepository::LatestHealthChecks(Transaction& t) {
  Statement st(TX(t).Handle(), std::string(sql::HEALTH_CHECK_COLUMNS) + sql::LATEST_HEALTH_CHECKS_JOIN);
  st.Require();

  std::vector<model::HealthCheckRecord> out;
  while (st.Step() == SQLITE_ROW) {
    auto record = ReadHealthCheck(st.Get());
    // two checks with the same timestamp collapse to one
    if (!out.empty() && out.back().instance_id == record.instance_id) continue;
    out.push_back(std::move(record));
  }
  return out;
}

HealthCounts SqliteRepository::CountHealthChecks(Transaction& t, const TimeRange& range) {
  Statement st(TX(t).Handle(), "SELECT COUNT(*), COALESCE(SUM(CASE WHEN healthy<>0 THEN 1 ELSE 0 END),0) FROM health_checks" +
                                   RangeClause("checked_at_ms", "instance_id", range) + ";");
  st.Require();
  BindRange(st.Get(), range);

  HealthCounts counts;
  if (st.Step() == SQLITE_ROW) {
    counts.total   = ColU64(st.Get(), 0);
    counts.healthy = ColU64(st.Get(), 1);
  }
  return counts;
}

std::optional<uint64_t> SqliteRepository::LastHealthyAt(Transaction& t, int64_t instance_id) {
  return ScalarMax(TX(t).Handle(), sql::LAST_HEALTHY_AT, instance_id);
}

std::optional<uint64_t> SqliteRepository::LastHealthCheckAt(Transaction& t) {
  return ScalarMax(TX(t).Handle(), sql::LAST_HEALTH_CHECK_AT);
}

Result SqliteRepository::DeleteHealthChecksBefore(Transaction& t, uint64_t cutoff_ms) {
  auto*     db = TX(t).Handle();
  Statement st(db, sql::DELETE_HEALTH_CHECKS_BEFORE);
  if (!st.Ok()) return Translate(db, st.PrepareCode());
  BindU64(st.Get(), 1, cutoff_ms);
  return Translate(db, st.Step());
}

// ------------------------------------------------------------------
// Error log
// ------------------------------------------------------------------

Result SqliteRepository::InsertError(Transaction& t, const model::ErrorRecord& r) {
  auto*     db = TX(t).Handle();
  Statement st(db, sql::INSERT_ERROR);
  if (!st.Ok()) return Translate(db, st.PrepareCode());

  BindI64(st.Get(), 1, r.instance_id);
  BindU64(st.Get(), 2, r.occurred_at_ms);
  sqlite3_bind_int(st.Get(), 3, static_cast<int>(r.category));
  BindText(st.Get(), 4, r.message);
  BindOptInt(st.Get(), 5, r.http_status);
  BindText(st.Get(), 6, r.http_body);

  return Translate(db, st.Step());
}

std::vector<model::ErrorRecord> SqliteRepository::ListErrors(Transaction& t, int64_t instance_id, std::size_t limit) {
  Statement st(TX(t).Handle(), sql::LIST_ERRORS);
  st.Require();
  BindI64(st.Get(), 1, instance_id);
  BindU64(st.Get(), 2, limit);

  std::vector<model::ErrorRecord> out;
  while (st.Step() == SQLITE_ROW) out.push_back(ReadError(st.Get()));
  return out;
}

std::size_t SqliteRepository::CountErrors(Transaction& t, int64_t instance_id) {
  Statement st(TX(t).Handle(), sql::COUNT_ERRORS);
  st.Require();
  BindI64(st.Get(), 1, instance_id);
  if (st.Step() != SQLITE_ROW) return 0;
  return static_cast<std::size_t>(ColU64(st.Get(), 0));
}

Result SqliteRepository::TrimErrors(Transaction& t, int64_t instance_id, std::size_t keep) {
  auto*     db = TX(t).Handle();
  Statement st(db, sql::TRIM_ERRORS);
  if (!st.Ok()) return Translate(db, st.PrepareCode());
  BindI64(st.Get(), 1, instance_id);
  BindI64(st.Get(), 2, instance_id);
  BindU64(st.Get(), 3, keep);
  return Translate(db, st.Step());
}

// ------------------------------------------------------------------
// Stats snapshots
// ------------------------------------------------------------------

Result SqliteRepository::InsertStatsSnapshot(Transaction& t, const model::StatsSnapshotRecord& r) {
  auto* db = TX(t).Handle();
  for (const auto& [counter, value] : r.counters) {
    Statement st(db, sql::INSERT_STATS_COUNTER);
    if (!st.Ok()) return Translate(db, st.PrepareCode());
    BindI64(st.Get(), 1, r.instance_id);
    BindU64(st.Get(), 2, r.collected_at_ms);
    BindText(st.Get(), 3, counter);
    BindI64(st.Get(), 4, value);
    auto result = Translate(db, st.Step());
    if (!result) return result;
  }
  return Result::Ok();
}

std::vector<model::StatsSnapshotRecord> SqliteRepository::ListStatsSnapshots(Transaction& t, const TimeRange& range) {
  Statement st(TX(t).Handle(), std::string(sql::STATS_COLUMNS) + RangeClause("collected_at_ms", "instance_id", range) +
                                   " ORDER BY collected_at_ms ASC, instance_id ASC;");
  st.Require();
  BindRange(st.Get(), range);

  std::vector<model::StatsSnapshotRecord> out;
  while (st.Step() == SQLITE_ROW) {
    const auto instance_id = ColI64(st.Get(), 0);
    const auto at          = ColU64(st.Get(), 1);
    if (out.empty() || out.back().instance_id != instance_id || out.back().collected_at_ms != at) {
      out.push_back({instance_id, at, {}});
    }
    out.back().counters[ColText(st.Get(), 2)] = ColI64(st.Get(), 3);
  }
  return out;
}

std::optional<uint64_t> SqliteRepository::LastStatsAt(Transaction& t) {
  return ScalarMax(TX(t).Handle(), sql::LAST_STATS_AT);
}

// ------------------------------------------------------------------
// Upstream version
// ------------------------------------------------------------------

Result SqliteRepository::SaveUpstreamVersion(Transaction& t, const model::UpstreamVersionRecord& r) {
  auto*     db = TX(t).Handle();
  Statement st(db, sql::UPSERT_UPSTREAM_VERSION);
  if (!st.Ok()) return Translate(db, st.PrepareCode());
  BindText(st.Get(), 1, r.commit);
  BindText(st.Get(), 2, r.branch);
  BindU64(st.Get(), 3, r.refreshed_at_ms);
  return Translate(db, st.Step());
}

std::optional<model::UpstreamVersionRecord> SqliteRepository::GetUpstreamVersion(Transaction& t) {
  Statement st(TX(t).Handle(), sql::SELECT_UPSTREAM_VERSION);
  st.Require();
  if (st.Step() != SQLITE_ROW) return std::nullopt;

  model::UpstreamVersionRecord r;
  r.commit          = ColText(st.Get(), 0);
  r.branch          = ColText(st.Get(), 1);
  r.refreshed_at_ms = ColU64(st.Get(), 2);
  return r;
}

} // namespace mirrorwatch::db::sqlite
