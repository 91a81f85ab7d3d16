#pragma once

#include <cstdint>
#include <map>
#include <string>

namespace mirrorwatch::db::model {

/*
  Counters reported by one instance's statistics endpoint at one tick.
  Stored as one row per counter.
*/

struct StatsSnapshotRecord {
  int64_t  instance_id     = 0;
  uint64_t collected_at_ms = 0;

  std::map<std::string, int64_t> counters;
};

} // namespace mirrorwatch::db::model
