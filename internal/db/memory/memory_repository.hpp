#pragma once

#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <vector>

#include "internal/db/api/repository.hpp"

namespace mirrorwatch::db::memory {

class MemoryTransaction;

/*
  In-process repository used by tests and by deployments without a
  configured database. Nothing survives a restart.

  Per-instance history lives behind shared pointers so that a
  transaction snapshot only clones the histories it writes to.
*/
class MemoryRepository final : public db::Repository {
 public:
  MemoryRepository();

  std::unique_ptr<Transaction> Begin() override;

  Result                               InsertInstance(Transaction&, model::InstanceRecord&) override;
  Result                               UpdateInstance(Transaction&, const model::InstanceRecord&) override;
  std::optional<model::InstanceRecord> GetInstance(Transaction&, int64_t id) override;
  std::optional<model::InstanceRecord> GetInstanceByDomain(Transaction&, const std::string& domain) override;
  std::vector<model::InstanceRecord>   ListInstances(Transaction&, bool enabled_only) override;

  Result                                 InsertHealthCheck(Transaction&, const model::HealthCheckRecord&) override;
  std::vector<model::HealthCheckRecord>  ListHealthChecks(Transaction&, const TimeRange&) override;
  std::vector<model::HealthCheckRecord>  RecentHealthChecks(Transaction&, int64_t instance_id, std::size_t limit) override;
  std::vector<model::HealthCheckRecord>  LatestHealthChecks(Transaction&) override;
  HealthCounts                           CountHealthChecks(Transaction&, const TimeRange&) override;
  std::optional<uint64_t>                LastHealthyAt(Transaction&, int64_t instance_id) override;
  std::optional<uint64_t>                LastHealthCheckAt(Transaction&) override;
  Result                                 DeleteHealthChecksBefore(Transaction&, uint64_t cutoff_ms) override;

  Result                          InsertError(Transaction&, const model::ErrorRecord&) override;
  std::vector<model::ErrorRecord> ListErrors(Transaction&, int64_t instance_id, std::size_t limit) override;
  std::size_t                     CountErrors(Transaction&, int64_t instance_id) override;
  Result                          TrimErrors(Transaction&, int64_t instance_id, std::size_t keep) override;

  Result                                  InsertStatsSnapshot(Transaction&, const model::StatsSnapshotRecord&) override;
  std::vector<model::StatsSnapshotRecord> ListStatsSnapshots(Transaction&, const TimeRange&) override;
  std::optional<uint64_t>                 LastStatsAt(Transaction&) override;

  Result                                       SaveUpstreamVersion(Transaction&, const model::UpstreamVersionRecord&) override;
  std::optional<model::UpstreamVersionRecord>  GetUpstreamVersion(Transaction&) override;

 private:
  friend class MemoryTransaction;

  using CheckHistory = std::vector<model::HealthCheckRecord>; // ascending checked_at_ms
  using ErrorLog     = std::deque<model::ErrorRecord>;        // ascending occurred_at_ms

  struct State {
    std::map<int64_t, model::InstanceRecord>              instances;
    std::unordered_map<std::string, int64_t>              domain_to_id;
    std::map<int64_t, std::shared_ptr<CheckHistory>>      health_checks;
    std::map<int64_t, std::shared_ptr<ErrorLog>>          errors;
    std::shared_ptr<std::vector<model::StatsSnapshotRecord>> stats;
    std::optional<model::UpstreamVersionRecord>           upstream;
    int64_t                                               next_instance_id = 1;
  };

  std::mutex writer_mutex_; // held for the lifetime of a transaction
  std::mutex mutex_;        // guards committed_
  State      committed_;
};

} // namespace mirrorwatch::db::memory
