#pragma once

#include <grpcpp/grpcpp.h>

#include <memory>

#include "api/mirrorwatch/v1.hpp"
#include "internal/service/status_service.hpp"
#include "mirrorwatch/v1/status_service.grpc.pb.h"

namespace mirrorwatch::grpc {

class StatusServer final : public mirrorwatch::v1::StatusService::Service {
 public:
  explicit StatusServer(std::shared_ptr<mirrorwatch::service::StatusService> svc);

  ::grpc::Status ListInstances(::grpc::ServerContext*, const mirrorwatch::v1::ListInstancesRequest*,
                               mirrorwatch::v1::ListInstancesResponse*) override;

  ::grpc::Status GetInstance(::grpc::ServerContext*, const mirrorwatch::v1::GetInstanceRequest*, mirrorwatch::v1::GetInstanceResponse*) override;

  ::grpc::Status QueryHealthHistory(::grpc::ServerContext*, const mirrorwatch::v1::HealthHistoryRequest*,
                                    mirrorwatch::v1::HealthHistoryResponse*) override;

  ::grpc::Status QueryStats(::grpc::ServerContext*, const mirrorwatch::v1::StatsRequest*, mirrorwatch::v1::StatsResponse*) override;

  ::grpc::Status GetUpstream(::grpc::ServerContext*, const mirrorwatch::v1::GetUpstreamRequest*, mirrorwatch::v1::UpstreamInfo*) override;

 private:
  std::shared_ptr<mirrorwatch::service::StatusService> service_;
};

} // namespace mirrorwatch::grpc
