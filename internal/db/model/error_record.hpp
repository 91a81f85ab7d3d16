#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "mirrorwatch/v1/types.pb.h"

namespace mirrorwatch::db::model {

struct ErrorRecord {
  int64_t  instance_id    = 0;
  uint64_t occurred_at_ms = 0;

  mirrorwatch::v1::ErrorCategory category = mirrorwatch::v1::ERROR_CATEGORY_UNSPECIFIED;

  std::string            message;
  std::optional<int32_t> http_status;
  std::string            http_body; // bounded by retention.max_error_body_bytes
};

} // namespace mirrorwatch::db::model
