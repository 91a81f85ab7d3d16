#pragma once

#include <optional>
#include <string>
#include <variant>

#include "internal/db/model/error_record.hpp"
#include "internal/db/model/health_check_record.hpp"

namespace mirrorwatch::probe {

// A completed probe: the health record to store and, unless muted, the
// failure detail that explains an unhealthy result.
struct ProbeReport {
  db::model::HealthCheckRecord           check;
  std::optional<db::model::ErrorRecord> error;
  v1::ErrorCategory                     category = v1::ERROR_CATEGORY_UNSPECIFIED;
  bool                                  muted    = false;
};

// A probe that never produced a report (not started before the tick
// deadline, or an unexpected exception inside the prober).
struct ProbeFailure {
  int64_t           instance_id = 0;
  v1::ErrorCategory category    = v1::ERROR_CATEGORY_INTERNAL;
  std::string       message;
};

using ProbeOutcome = std::variant<ProbeReport, ProbeFailure>;

} // namespace mirrorwatch::probe
