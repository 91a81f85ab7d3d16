#pragma once

#include <memory>
#include <vector>

#include "config/config.pb.h"
#include "internal/db/api/repository.hpp"
#include "internal/probe/instance_overrides.hpp"
#include "internal/registry/instance_registry.hpp"
#include "internal/retention/retention_service.hpp"
#include "internal/retention/stats_collector.hpp"
#include "internal/upstream/version_oracle.hpp"
#include "periodic_task.hpp"
#include "probe_scheduler.hpp"
#include "worker_pool.hpp"

namespace mirrorwatch::scheduler {

struct ScannerComponents {
  std::shared_ptr<db::Repository>              repository;
  std::shared_ptr<registry::InstanceRegistry>  registry;
  std::shared_ptr<upstream::VersionOracle>     oracle;
  std::shared_ptr<ProbeScheduler>              probes;
  std::shared_ptr<retention::RetentionService> retention;
  // null when statistics collection is disabled
  std::shared_ptr<retention::StatsCollector> stats;
  std::shared_ptr<probe::OverrideTable>      overrides;
  // shut down before the loops are joined
  std::vector<std::shared_ptr<WorkerPool>> pools;
};

/*
  Owns the background loops:

    registry   refresh the tracked instances from the public listing
    upstream   refresh the upstream branch head
    probe      one probe tick per interval
    stats      poll statistics endpoints
    cleanup    retention

  With health checks disabled only cleanup runs. Probe and stats resume
  from the last stored timestamp, so a restart does not probe early.
*/
class Scanner {
 public:
  Scanner(const mirrorwatch::runtime::config::RuntimeConfig& config, ScannerComponents components);
  ~Scanner();

  Scanner(const Scanner&)            = delete;
  Scanner& operator=(const Scanner&) = delete;

  void Start();
  void Stop();

  // Single passes of each loop body.
  void RefreshRegistry();
  void RefreshUpstream();
  void ProbeOnce();
  void CollectStats();
  void Cleanup();

 private:
  void UpdateFleetGauge();

  mirrorwatch::runtime::config::RuntimeConfig config_;
  ScannerComponents                           components_;
  std::vector<std::unique_ptr<PeriodicTask>>  tasks_;
  bool                                        started_ = false;
};

} // namespace mirrorwatch::scheduler
