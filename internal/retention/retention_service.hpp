#pragma once

#include <chrono>
#include <cstddef>
#include <memory>

#include "config/config.pb.h"
#include "internal/db/api/repository.hpp"

namespace mirrorwatch::retention {

struct CleanupReport {
  std::size_t instances_trimmed   = 0;
  bool        health_checks_pruned = false;
};

/*
  Bounds stored history.

  Error records are capped per instance (newest kept). Health checks older
  than the horizon are deleted; a zero horizon keeps them forever. Runs even
  when health checks are switched off.
*/
class RetentionService {
 public:
  RetentionService(mirrorwatch::runtime::config::RetentionConfig config, std::shared_ptr<db::Repository> repository);

  // Storage failures throw util::StorageError.
  CleanupReport Cleanup();

 private:
  std::shared_ptr<db::Repository> repository_;
  std::size_t                     error_retention_;
  std::chrono::milliseconds       horizon_;
};

} // namespace mirrorwatch::retention
