#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "mirrorwatch/v1/types.pb.h"

namespace mirrorwatch::db::model {

/*
  One probe outcome. Append-only, never updated after insert.
*/

struct HealthCheckRecord {
  int64_t  instance_id   = 0;
  uint64_t checked_at_ms = 0;

  bool healthy = false;

  // Absent when no HTTP response was received.
  std::optional<int64_t> response_time_ms;
  std::optional<int32_t> http_status;

  std::optional<std::string> version;
  std::optional<std::string> version_url;

  bool is_upstream       = false;
  bool is_latest_version = false;
  bool rss               = false;

  mirrorwatch::v1::Connectivity connectivity = mirrorwatch::v1::CONNECTIVITY_UNKNOWN;
};

} // namespace mirrorwatch::db::model
