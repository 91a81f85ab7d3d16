#pragma once

#include "api/mirrorwatch/v1.hpp"
#include "internal/scoring/scoring_engine.hpp"
#include "service_context.hpp"

namespace mirrorwatch::service {

// Builds the public view of one scored instance.
v1::InstanceSnapshot ToSnapshot(const scoring::InstanceScore& score);

/*
  Read-only queries over the stored fleet state. Everything is computed
  from the store on each call; nothing here talks to the network.

  Throws util::NotFound for unknown domains and util::InvalidArgument for
  malformed ranges.
*/
class StatusService {
 public:
  explicit StatusService(ServiceContext ctx);

  v1::ListInstancesResponse ListInstances(const v1::ListInstancesRequest& req);

  v1::GetInstanceResponse GetInstance(const v1::GetInstanceRequest& req);

  v1::HealthHistoryResponse QueryHealthHistory(const v1::HealthHistoryRequest& req);

  v1::StatsResponse QueryStats(const v1::StatsRequest& req);

  v1::UpstreamInfo GetUpstream(const v1::GetUpstreamRequest& req);

 private:
  ServiceContext ctx_;
};

} // namespace mirrorwatch::service
