#include "retention_service.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace mirrorwatch::retention {

RetentionService::RetentionService(mirrorwatch::runtime::config::RetentionConfig config, std::shared_ptr<db::Repository> repository)
    : repository_(std::move(repository)),
      error_retention_(config.error_retention_per_host()),
      horizon_(util::ToMillis(config.health_check_horizon())) {
}

CleanupReport RetentionService::Cleanup() {
  CleanupReport report;

  auto tx = repository_->Begin();

  for (const auto& instance : repository_->ListInstances(*tx, false)) {
    const auto stored = repository_->CountErrors(*tx, instance.id);
    if (stored <= error_retention_) continue;

    if (auto result = repository_->TrimErrors(*tx, instance.id, error_retention_); !result) {
      throw util::StorageError("trim errors of " + instance.domain + ": " + result.Describe());
    }
    ++report.instances_trimmed;
    MIRRORWATCH_LOG_DEBUG("trimmed error log",
                          {observability::StringField("domain", instance.domain),
                           observability::IntField("deleted", static_cast<std::int64_t>(stored - error_retention_))});
  }

  if (horizon_.count() > 0) {
    const auto now_ms = util::ToUnixMillis(util::Now());
    const auto span   = static_cast<uint64_t>(horizon_.count());
    if (now_ms > span) {
      if (auto result = repository_->DeleteHealthChecksBefore(*tx, now_ms - span); !result) {
        throw util::StorageError("prune health checks: " + result.Describe());
      }
      report.health_checks_pruned = true;
    }
  }

  tx->Commit();

  MIRRORWATCH_LOG_INFO("cleanup finished", {observability::IntField("instances_trimmed", static_cast<std::int64_t>(report.instances_trimmed)),
                                            observability::BoolField("health_checks_pruned", report.health_checks_pruned)});
  return report;
}

} // namespace mirrorwatch::retention
