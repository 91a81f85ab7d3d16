#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <variant>
#include <vector>

#include "config/config.pb.h"
#include "internal/db/api/repository.hpp"
#include "internal/http/fetch_error.hpp"
#include "internal/http/http_client.hpp"
#include "internal/probe/instance_overrides.hpp"
#include "internal/scheduler/worker_pool.hpp"

namespace mirrorwatch::retention {

inline constexpr const char* kAccountsTotal   = "accounts_total";
inline constexpr const char* kAccountsLimited = "accounts_limited";
inline constexpr const char* kRequestsTotal   = "requests_total";

struct StatsParseError {
  std::string message;
};

// Counters of one statistics document. Missing fields read 0.
using StatsParseOutcome = std::variant<std::map<std::string, int64_t>, StatsParseError>;

// Accepts both the "accounts" and the older "sessions" spelling.
StatsParseOutcome ParseHealthReport(const std::string& body);

struct CollectReport {
  std::size_t polled   = 0;
  std::size_t stored   = 0;
  // 404 or disabled endpoint
  std::size_t unavailable = 0;
  std::size_t failed      = 0;
};

/*
  Polls every enabled instance's statistics endpoint and stores one
  snapshot per responding instance, all stamped with the tick time.
  A missing endpoint is normal and not an error.
*/
class StatsCollector {
 public:
  StatsCollector(const mirrorwatch::runtime::config::RuntimeConfig& config, std::shared_ptr<http::HttpClient> client,
                 std::shared_ptr<db::Repository> repository, std::shared_ptr<scheduler::WorkerPool> pool);

  // Storage failures throw util::StorageError.
  CollectReport Collect();

  // Fetches and parses one instance; nullopt when it has no usable stats.
  std::optional<db::model::StatsSnapshotRecord> Poll(const db::model::InstanceRecord& instance, uint64_t collected_at_ms,
                                                     CollectReport& report);

 private:
  std::shared_ptr<http::HttpClient>      client_;
  std::shared_ptr<db::Repository>        repository_;
  std::shared_ptr<scheduler::WorkerPool> pool_;
  probe::OverrideTable                   overrides_;
  std::chrono::milliseconds              request_timeout_;
};

} // namespace mirrorwatch::retention
