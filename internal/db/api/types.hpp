#pragma once

#include <cstdint>
#include <optional>

namespace mirrorwatch::db {

struct HealthCounts {
  uint64_t total   = 0;
  uint64_t healthy = 0;
};

// Half-open time range [from_ms, to_ms), optionally restricted to one instance.
struct TimeRange {
  uint64_t               from_ms = 0;
  uint64_t               to_ms   = 0;
  std::optional<int64_t> instance_id;
};

} // namespace mirrorwatch::db
