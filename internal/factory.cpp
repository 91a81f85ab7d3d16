#include "factory.hpp"

#include <memory>
#include <string>

#include "internal/db/memory/memory_repository.hpp"
#include "internal/http/beast_http_client.hpp"
#include "internal/probe/connectivity_checker.hpp"
#include "internal/probe/health_prober.hpp"
#include "internal/scoring/scoring_engine.hpp"
#include "internal/service/service_context.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#if MIRRORWATCH_ENABLE_GRPC
#include "internal/grpc/status_server.hpp"
#endif
#if MIRRORWATCH_DB_SQLITE
#include "internal/db/sqlite/sqlite_db.hpp"
#include "internal/db/sqlite/sqlite_repository.hpp"
#endif
#if MIRRORWATCH_DB_POSTGRES
#include "internal/db/postgres/pg_pool.hpp"
#include "internal/db/postgres/pg_repository.hpp"
#endif

namespace mirrorwatch::factory {

std::shared_ptr<db::Repository> BuildRepository(const mirrorwatch::runtime::config::RuntimeConfig& config) {
  const auto& database = config.database();
  if (database.has_sqlite()) {
#if MIRRORWATCH_DB_SQLITE
    auto sqlite_db = std::make_shared<db::sqlite::SqliteDB>(database.sqlite().path(), database.sqlite().wal_mode());
    sqlite_db->ApplySchema();
    return std::make_shared<db::sqlite::SqliteRepository>(std::move(sqlite_db));
#else
    throw util::ConfigurationError("sqlite backend requested but not enabled at build time");
#endif
  }

  if (database.has_postgres()) {
#if MIRRORWATCH_DB_POSTGRES
    auto pool = std::make_shared<db::postgres::PgPool>(database.postgres().connection_uri(), database.postgres().max_connections());
    pool->ApplySchema();
    return std::make_shared<db::postgres::PgRepository>(std::move(pool));
#else
    throw util::ConfigurationError("postgres backend requested but not enabled at build time");
#endif
  }

  return std::make_shared<db::memory::MemoryRepository>();
}

/*
    Build full application dependency graph
*/
Application Build(const mirrorwatch::runtime::config::RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Storage
  // ------------------------------------------------------------------
  app.repository = BuildRepository(config);

  // ------------------------------------------------------------------
  // Network seams
  // ------------------------------------------------------------------
  const auto& scanner         = config.scanner();
  const auto  request_timeout = util::ToMillis(scanner.request_timeout(), std::chrono::seconds(10));

  http::ClientOptions client_options;
  client_options.user_agent    = http::UserAgentFor(scanner.site_url());
  client_options.max_redirects = scanner.max_redirects();
  client_options.verify_tls    = !scanner.skip_tls_verify();
  auto client                  = std::make_shared<http::BeastHttpClient>(client_options);

  auto connectivity = std::make_shared<probe::AsioConnectivityChecker>(config.probe().connectivity_connect(), config.probe().connectivity_port());

  // ------------------------------------------------------------------
  // Core components
  // ------------------------------------------------------------------
  auto oracle    = std::make_shared<upstream::VersionOracle>(config.upstream(), client, app.repository, request_timeout);
  auto instances = std::make_shared<registry::InstanceRegistry>(config.registry(), client, app.repository, request_timeout);
  auto prober    = std::make_shared<probe::HealthProber>(config, client, connectivity, oracle);
  auto overrides = std::make_shared<probe::OverrideTable>(config);

  auto probe_pool = std::make_shared<scheduler::WorkerPool>("probe", scanner.workers());
  auto probes     = std::make_shared<scheduler::ProbeScheduler>(config, app.repository, prober, oracle, probe_pool);

  scheduler::ScannerComponents components;
  components.repository = app.repository;
  components.registry   = instances;
  components.oracle     = oracle;
  components.probes     = probes;
  components.retention  = std::make_shared<retention::RetentionService>(config.retention(), app.repository);
  components.overrides  = overrides;
  components.pools.push_back(probe_pool);

  if (!config.stats().disabled()) {
    auto stats_pool  = std::make_shared<scheduler::WorkerPool>("stats", std::max<uint32_t>(1, scanner.workers() / 4));
    components.stats = std::make_shared<retention::StatsCollector>(config, client, app.repository, stats_pool);
    components.pools.push_back(stats_pool);
  }

  app.scanner = std::make_unique<scheduler::Scanner>(config, std::move(components));

  // ------------------------------------------------------------------
  // Read API
  // ------------------------------------------------------------------
  service::ServiceContext ctx;
  ctx.repository  = app.repository;
  ctx.scoring     = std::make_shared<scoring::ScoringEngine>(config);
  ctx.error_limit = config.retention().error_retention_per_host();

  app.status_service = std::make_shared<service::StatusService>(ctx);

#if MIRRORWATCH_ENABLE_GRPC
  app.grpc_services.push_back(std::make_unique<grpc::StatusServer>(app.status_service));
#endif

  return app;
}

} // namespace mirrorwatch::factory
