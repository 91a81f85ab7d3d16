#pragma once

#include <cstddef>
#include <memory>

namespace mirrorwatch::db { class Repository; }
namespace mirrorwatch::scoring { class ScoringEngine; }

namespace mirrorwatch::service {

/*
  Dependency container shared by the read API.
*/
struct ServiceContext {
  std::shared_ptr<mirrorwatch::db::Repository>         repository;
  std::shared_ptr<mirrorwatch::scoring::ScoringEngine> scoring;
  // errors returned by GetInstance
  std::size_t error_limit = 20;
};

} // namespace mirrorwatch::service
