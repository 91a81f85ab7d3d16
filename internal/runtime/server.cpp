#include "server.hpp"

#include <chrono>

#include <grpcpp/health_check_service_interface.h>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace mirrorwatch::runtime {

namespace {

// Read requests still running at shutdown get this long to finish.
constexpr auto kShutdownGrace = std::chrono::seconds(2);

} // namespace

Server::Server(std::string bind_address, std::vector<std::unique_ptr<::grpc::Service>> services)
    : bind_address_(std::move(bind_address)), services_(std::move(services)) {
}

Server::~Server() {
  Stop();
}

void Server::Start() {
  ::grpc::EnableDefaultHealthCheckService(true);

  ::grpc::ServerBuilder builder;
  builder.AddListeningPort(bind_address_, ::grpc::InsecureServerCredentials(), &bound_port_);
  for (auto& service : services_) {
    builder.RegisterService(service.get());
  }

  grpc_server_ = builder.BuildAndStart();
  if (!grpc_server_ || bound_port_ == 0) {
    grpc_server_.reset();
    throw util::ConfigurationError("cannot listen on " + bind_address_);
  }

  MIRRORWATCH_LOG_INFO("read API listening", {observability::StringField("bind_address", bind_address_), observability::IntField("port", bound_port_)});
}

void Server::Wait() {
  if (grpc_server_) grpc_server_->Wait();
}

void Server::Stop() {
  if (!grpc_server_) return;
  grpc_server_->Shutdown(std::chrono::system_clock::now() + kShutdownGrace);
  grpc_server_.reset();
  MIRRORWATCH_LOG_INFO("read API stopped");
}

} // namespace mirrorwatch::runtime
