#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <variant>

#include "config/config.pb.h"
#include "internal/db/api/repository.hpp"
#include "internal/http/fetch_error.hpp"
#include "internal/http/http_client.hpp"

namespace mirrorwatch::upstream {

struct UpstreamVersion {
  std::string commit; // empty while unknown
  std::string branch;
  uint64_t    refreshed_at_ms = 0;

  bool Known() const {
    return !commit.empty();
  }
};

/*
  Single-writer, multi-reader holder of the current upstream version.

  Starts out unknown. Only the oracle loop calls Set; readers get an
  immutable snapshot without taking a lock.
*/
class VersionHolder {
 public:
  VersionHolder();

  std::shared_ptr<const UpstreamVersion> Get() const;
  void                                   Set(UpstreamVersion version);

 private:
  std::atomic<std::shared_ptr<const UpstreamVersion>> current_;
};

struct CommitClassification {
  v1::CommitStatus status = v1::COMMIT_STATUS_UNKNOWN;
  // false when the answer could not be obtained (no head yet, network error)
  bool resolved = false;
};

using RefreshOutcome = std::variant<UpstreamVersion, http::FetchError>;

/*
  Upstream Version Oracle.

  Resolves the head of the tracked branch from the git smart-HTTP ref
  advertisement, without cloning. A failed refresh keeps the previous value.

  Commit classification asks the compare endpoint whether a commit is
  reachable from the head. Answers are cached per commit; every refresh
  starts a new epoch and entries not used during the previous epoch are
  dropped.
*/
class VersionOracle {
 public:
  VersionOracle(mirrorwatch::runtime::config::UpstreamConfig config, std::shared_ptr<http::HttpClient> client,
                std::shared_ptr<db::Repository> repository, std::chrono::milliseconds request_timeout);

  // Seeds the holder from the last persisted value.
  void Restore();

  RefreshOutcome Refresh();

  std::shared_ptr<const UpstreamVersion> Current() const {
    return holder_.Get();
  }

  // Classifies against the current value, or against `head` when the
  // caller already holds a snapshot.
  CommitClassification Classify(const std::string& commit);
  CommitClassification Classify(const std::string& commit, const UpstreamVersion& head);

  // True when the version URL points into the upstream repository.
  bool IsUpstreamUrl(const std::string& version_url) const;

  std::size_t CacheSize() const;

 private:
  struct CacheEntry {
    v1::CommitStatus status;
    uint64_t         epoch;
  };

  CommitClassification Compare(const std::string& commit, const std::string& head);
  void                 CycleEpoch();

  mirrorwatch::runtime::config::UpstreamConfig config_;
  std::shared_ptr<http::HttpClient>            client_;
  std::shared_ptr<db::Repository>              repository_;
  std::chrono::milliseconds                    request_timeout_;

  VersionHolder holder_;

  mutable std::mutex                          cache_mutex_;
  std::unordered_map<std::string, CacheEntry> cache_;
  std::string                                 cache_head_;
  uint64_t                                    epoch_ = 0;
};

} // namespace mirrorwatch::upstream
