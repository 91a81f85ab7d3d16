#pragma once

#include <chrono>
#include <memory>
#include <variant>
#include <vector>

#include "config/config.pb.h"
#include "instance_list_parser.hpp"
#include "internal/db/api/repository.hpp"
#include "internal/http/fetch_error.hpp"
#include "internal/http/http_client.hpp"

namespace mirrorwatch::registry {

struct ReconcileReport {
  std::vector<db::model::InstanceRecord> added;
  std::vector<db::model::InstanceRecord> retained;
  // Active instances missing from this pass; `enabled` tells whether the
  // miss retired them.
  std::vector<db::model::InstanceRecord> removed_candidates;
};

using ReconcileOutcome = std::variant<ReconcileReport, http::FetchError, ListParseError>;

/*
  Instance Registry.

  Keeps the instances table in line with the public listing plus the
  statically configured hosts. Rows are never deleted: an instance that
  disappears only accumulates missed passes and is disabled once
  retire_after_missed_passes (when non-zero) is reached. Reappearing
  instances are re-enabled.
*/
class InstanceRegistry {
 public:
  InstanceRegistry(mirrorwatch::runtime::config::RegistryConfig config, std::shared_ptr<http::HttpClient> client,
                   std::shared_ptr<db::Repository> repository, std::chrono::milliseconds request_timeout);

  // Fetch, parse and apply. Storage failures throw util::StorageError.
  ReconcileOutcome Reconcile();

  // Applies an already parsed listing.
  ReconcileReport Apply(const ListedInstances& listed);

 private:
  ListedInstances Merge(const ListedInstances& listed) const;

  mirrorwatch::runtime::config::RegistryConfig config_;
  std::shared_ptr<http::HttpClient>            client_;
  std::shared_ptr<db::Repository>              repository_;
  std::chrono::milliseconds                    request_timeout_;
};

} // namespace mirrorwatch::registry
