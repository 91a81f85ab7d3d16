#include "status_server.hpp"

#include "grpc_error.hpp"

namespace mirrorwatch::grpc {

using namespace mirrorwatch::v1;

namespace {

// Runs one read against the service; exceptions become status codes.
template <typename Response, typename Call>
::grpc::Status Serve(::grpc::ServerContext* ctx, Response* resp, Call&& call) {
  if (ctx != nullptr && ctx->IsCancelled()) {
    return {::grpc::StatusCode::CANCELLED, "request cancelled by client"};
  }
  try {
    *resp = call();
    return ::grpc::Status::OK;
  } catch (const std::exception& e) {
    return ToStatus(e);
  }
}

} // namespace

StatusServer::StatusServer(std::shared_ptr<mirrorwatch::service::StatusService> svc) : service_(std::move(svc)) {
}

::grpc::Status StatusServer::ListInstances(::grpc::ServerContext* ctx, const ListInstancesRequest* req, ListInstancesResponse* resp) {
  return Serve(ctx, resp, [&] { return service_->ListInstances(*req); });
}

::grpc::Status StatusServer::GetInstance(::grpc::ServerContext* ctx, const GetInstanceRequest* req, GetInstanceResponse* resp) {
  return Serve(ctx, resp, [&] { return service_->GetInstance(*req); });
}

::grpc::Status StatusServer::QueryHealthHistory(::grpc::ServerContext* ctx, const HealthHistoryRequest* req, HealthHistoryResponse* resp) {
  return Serve(ctx, resp, [&] { return service_->QueryHealthHistory(*req); });
}

::grpc::Status StatusServer::QueryStats(::grpc::ServerContext* ctx, const StatsRequest* req, StatsResponse* resp) {
  return Serve(ctx, resp, [&] { return service_->QueryStats(*req); });
}

::grpc::Status StatusServer::GetUpstream(::grpc::ServerContext* ctx, const GetUpstreamRequest* req, UpstreamInfo* resp) {
  return Serve(ctx, resp, [&] { return service_->GetUpstream(*req); });
}

} // namespace mirrorwatch::grpc
