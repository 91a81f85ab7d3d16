#pragma once

#include <cstdint>
#include <string>

namespace mirrorwatch::db::model {

// Single row: last branch head seen by the version oracle.
struct UpstreamVersionRecord {
  std::string commit;
  std::string branch;
  uint64_t    refreshed_at_ms = 0;
};

} // namespace mirrorwatch::db::model
