#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "internal/db/api/result.hpp"
#include "internal/db/api/transaction.hpp"
#include "internal/db/api/types.hpp"
#include "internal/db/model/error_record.hpp"
#include "internal/db/model/health_check_record.hpp"
#include "internal/db/model/instance_record.hpp"
#include "internal/db/model/stats_snapshot_record.hpp"
#include "internal/db/model/upstream_version_record.hpp"

namespace mirrorwatch::db {

/*
  Repository abstraction.

  CRITICAL GUARANTEES:

  - All reads and writes go through a Transaction
  - Reads inside a transaction see its writes
  - History (health checks, errors, stats) is append-only apart from
    retention trimming; only instances and the upstream version row are
    updated in place (last writer wins)

  The DB is the source of truth for:
    instances
    health check history
    error log
    stats snapshots
    the last known upstream version
*/

class Repository {
 public:
  virtual ~Repository() = default;

  // ---------------------------------------------------------------------
  // Transactions
  // ---------------------------------------------------------------------

  virtual std::unique_ptr<Transaction> Begin() = 0;

  // ---------------------------------------------------------------------
  // Instances
  // ---------------------------------------------------------------------

  // Assigns record.id.
  virtual Result InsertInstance(Transaction&, model::InstanceRecord& record) = 0;

  virtual Result UpdateInstance(Transaction&, const model::InstanceRecord&) = 0;

  virtual std::optional<model::InstanceRecord> GetInstance(Transaction&, int64_t id) = 0;

  virtual std::optional<model::InstanceRecord> GetInstanceByDomain(Transaction&, const std::string& domain) = 0;

  // Ordered by id.
  virtual std::vector<model::InstanceRecord> ListInstances(Transaction&, bool enabled_only) = 0;

  // ---------------------------------------------------------------------
  // Health checks
  // ---------------------------------------------------------------------

  virtual Result InsertHealthCheck(Transaction&, const model::HealthCheckRecord&) = 0;

  // Oldest first.
  virtual std::vector<model::HealthCheckRecord> ListHealthChecks(Transaction&, const TimeRange& range) = 0;

  // Newest first, at most `limit`.
  virtual std::vector<model::HealthCheckRecord> RecentHealthChecks(Transaction&, int64_t instance_id, std::size_t limit) = 0;

  // Latest check of every instance that has one.
  virtual std::vector<model::HealthCheckRecord> LatestHealthChecks(Transaction&) = 0;

  virtual HealthCounts CountHealthChecks(Transaction&, const TimeRange& range) = 0;

  virtual std::optional<uint64_t> LastHealthyAt(Transaction&, int64_t instance_id) = 0;

  // Newest check time across all instances.
  virtual std::optional<uint64_t> LastHealthCheckAt(Transaction&) = 0;

  virtual Result DeleteHealthChecksBefore(Transaction&, uint64_t cutoff_ms) = 0;

  // ---------------------------------------------------------------------
  // Error log
  // ---------------------------------------------------------------------

  virtual Result InsertError(Transaction&, const model::ErrorRecord&) = 0;

  // Newest first, at most `limit`.
  virtual std::vector<model::ErrorRecord> ListErrors(Transaction&, int64_t instance_id, std::size_t limit) = 0;

  virtual std::size_t CountErrors(Transaction&, int64_t instance_id) = 0;

  // Keeps the `keep` newest errors of the instance.
  virtual Result TrimErrors(Transaction&, int64_t instance_id, std::size_t keep) = 0;

  // ---------------------------------------------------------------------
  // Stats snapshots
  // ---------------------------------------------------------------------

  virtual Result InsertStatsSnapshot(Transaction&, const model::StatsSnapshotRecord&) = 0;

  // Oldest first.
  virtual std::vector<model::StatsSnapshotRecord> ListStatsSnapshots(Transaction&, const TimeRange& range) = 0;

  virtual std::optional<uint64_t> LastStatsAt(Transaction&) = 0;

  // ---------------------------------------------------------------------
  // Upstream version
  // ---------------------------------------------------------------------

  virtual Result SaveUpstreamVersion(Transaction&, const model::UpstreamVersionRecord&) = 0;

  virtual std::optional<model::UpstreamVersionRecord> GetUpstreamVersion(Transaction&) = 0;
};

} // namespace mirrorwatch::db
