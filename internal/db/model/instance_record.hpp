#pragma once

#include <cstdint>
#include <string>

namespace mirrorwatch::db::model {

/*
  Persistent instance row.

  IMPORTANT:
  - Domain is unique; rows are never hard-deleted, retirement clears `enabled`.
  - missed_passes counts consecutive registry passes without this domain.
*/

struct InstanceRecord {
  int64_t id = 0; // assigned on insert

  std::string domain;
  std::string url;
  std::string country;

  bool is_additional = false;
  bool is_bad_host   = false;
  bool enabled       = true;

  uint32_t missed_passes = 0;

  uint64_t created_at_ms = 0;
  uint64_t updated_at_ms = 0;
};

} // namespace mirrorwatch::db::model
