#pragma once

#include <memory>

#include "internal/db/api/repository.hpp"
#include "sqlite_db.hpp"
#include "sqlite_tx.hpp"

namespace mirrorwatch::db::sqlite {

class SqliteRepository final : public db::Repository {
 public:
  explicit SqliteRepository(std::shared_ptr<SqliteDB> db);

  std::unique_ptr<Transaction> Begin() override;

  Result                               InsertInstance(Transaction&, model::InstanceRecord&) override;
  Result                               UpdateInstance(Transaction&, const model::InstanceRecord&) override;
  std::optional<model::InstanceRecord> GetInstance(Transaction&, int64_t id) override;
  std::optional<model::InstanceRecord> GetInstanceByDomain(Transaction&, const std::string& domain) override;
  std::vector<model::InstanceRecord>   ListInstances(Transaction&, bool enabled_only) override;

  Result                                InsertHealthCheck(Transaction&, const model::HealthCheckRecord&) override;
  std::vector<model::HealthCheckRecord> ListHealthChecks(Transaction&, const TimeRange&) override;
  std::vector<model::HealthCheckRecord> RecentHealthChecks(Transaction&, int64_t instance_id, std::size_t limit) override;
  std::vector<model::HealthCheckRecord> LatestHealthChecks(Transaction&) override;
  HealthCounts                          CountHealthChecks(Transaction&, const TimeRange&) override;
  std::optional<uint64_t>               LastHealthyAt(Transaction&, int64_t instance_id) override;
  std::optional<uint64_t>               LastHealthCheckAt(Transaction&) override;
  Result                                DeleteHealthChecksBefore(Transaction&, uint64_t cutoff_ms) override;

  Result                          InsertError(Transaction&, const model::ErrorRecord&) override;
  std::vector<model::ErrorRecord> ListErrors(Transaction&, int64_t instance_id, std::size_t limit) override;
  std::size_t                     CountErrors(Transaction&, int64_t instance_id) override;
  Result                          TrimErrors(Transaction&, int64_t instance_id, std::size_t keep) override;

  Result                                  InsertStatsSnapshot(Transaction&, const model::StatsSnapshotRecord&) override;
  std::vector<model::StatsSnapshotRecord> ListStatsSnapshots(Transaction&, const TimeRange&) override;
  std::optional<uint64_t>                 LastStatsAt(Transaction&) override;

  Result                                      SaveUpstreamVersion(Transaction&, const model::UpstreamVersionRecord&) override;
  std::optional<model::UpstreamVersionRecord> GetUpstreamVersion(Transaction&) override;

 private:
  std::shared_ptr<SqliteDB> db_;

  static SqliteTransaction& TX(Transaction& t);
  static Result             Translate(sqlite3* db, int rc);
};

} // namespace mirrorwatch::db::sqlite
