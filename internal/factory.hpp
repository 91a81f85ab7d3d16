#pragma once

#include <memory>
#include <vector>

#include "config/config.pb.h"
#include "internal/db/api/repository.hpp"
#include "internal/scheduler/scanner.hpp"
#include "internal/service/status_service.hpp"

#if MIRRORWATCH_ENABLE_GRPC
#include <grpcpp/grpcpp.h>
#endif

namespace mirrorwatch::factory {

/*
  Application

  Owns all long-lived objects of the daemon. Everything here lives for the
  lifetime of the process.
*/
struct Application {
  std::shared_ptr<db::Repository>          repository;
  std::shared_ptr<service::StatusService>  status_service;
  std::unique_ptr<scheduler::Scanner>      scanner;
#if MIRRORWATCH_ENABLE_GRPC
  std::vector<std::unique_ptr<::grpc::Service>> grpc_services;
#endif
};

/*
  Opens the configured store and bootstraps its schema. No backend
  selected means the in-memory repository.
*/
std::shared_ptr<db::Repository> BuildRepository(const mirrorwatch::runtime::config::RuntimeConfig& config);

/*
  Build

  Composition root of the daemon; the ONLY place that knows concrete
  store, HTTP and DNS types. The scanner is built but not started.
*/
Application Build(const mirrorwatch::runtime::config::RuntimeConfig& config);

} // namespace mirrorwatch::factory
