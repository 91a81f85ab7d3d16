#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <set>

#include "config/config.pb.h"
#include "internal/db/api/repository.hpp"
#include "internal/probe/health_prober.hpp"
#include "internal/upstream/version_oracle.hpp"
#include "worker_pool.hpp"

namespace mirrorwatch::scheduler {

struct TickSummary {
  std::size_t dispatched        = 0;
  std::size_t skipped_in_flight = 0;
  std::size_t completed         = 0;
  // not started before the deadline
  std::size_t expired = 0;
  // still running when the tick stopped waiting
  std::size_t overran = 0;
  bool        deadline_hit = false;
};

/*
  Probe Scheduler.

  One tick probes every enabled instance once, on a bounded worker pool,
  and writes each outcome in its own transaction. The tick waits at most
  until its deadline:

    - jobs that have not started by then record healthy=false with the
      deadline category instead of probing
    - jobs still running keep going and write their result when done;
      their instances are skipped by the next tick until they finish

  No retries inside a tick.
*/
class ProbeScheduler {
 public:
  ProbeScheduler(const mirrorwatch::runtime::config::RuntimeConfig& config, std::shared_ptr<db::Repository> repository,
                 std::shared_ptr<probe::HealthProber> prober, std::shared_ptr<upstream::VersionOracle> oracle,
                 std::shared_ptr<WorkerPool> pool);

  TickSummary RunTick();

  // Wakes a tick waiting for its deadline; used on shutdown.
  void Interrupt();

  std::size_t InFlight() const;

 private:
  struct Tick {
    std::chrono::steady_clock::time_point deadline;
    std::mutex                            mutex;
    std::condition_variable               cv;
    std::size_t                           remaining = 0;
    std::size_t                           expired   = 0;
  };

  void Execute(const db::model::InstanceRecord& instance, const probe::ProbeContext& context, const std::shared_ptr<Tick>& tick);
  void Persist(const probe::ProbeOutcome& outcome, const db::model::InstanceRecord& instance, bool muted);
  void Finish(int64_t instance_id, const std::shared_ptr<Tick>& tick, bool expired);

  std::shared_ptr<db::Repository>          repository_;
  std::shared_ptr<probe::HealthProber>     prober_;
  std::shared_ptr<upstream::VersionOracle> oracle_;
  std::shared_ptr<WorkerPool>              pool_;

  std::chrono::milliseconds tick_deadline_;
  std::size_t               error_retention_;
  bool                      auto_mute_;

  mutable std::mutex    in_flight_mutex_;
  std::set<int64_t>     in_flight_;
  std::shared_ptr<Tick> current_;
  bool                  interrupted_ = false;
};

} // namespace mirrorwatch::scheduler
