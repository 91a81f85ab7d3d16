#include <chrono>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/errors.hpp"
#if MIRRORWATCH_ENABLE_GRPC
#include "internal/runtime/server.hpp"
#endif

static volatile std::sig_atomic_t g_running = 1;

void HandleSignal(int) {
  g_running = 0;
}

static void ShutdownObservability() {
  mirrorwatch::observability::ShutdownLogging();
  mirrorwatch::observability::ShutdownMetrics();
  mirrorwatch::observability::ShutdownTracing();
}

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "Usage: mirrorwatch <config.yaml> OR mirrorwatch --config <config.yaml>" << std::endl;
    return 1;
  }

  mirrorwatch::runtime::config::RuntimeConfig config;
  try {
    config = mirrorwatch::config::ConfigLoader::LoadFromYaml(config_path);
  } catch (const mirrorwatch::util::ConfigurationError& e) {
    std::cerr << "invalid configuration: " << e.what() << std::endl;
    return 2;
  }

  try {
    mirrorwatch::observability::InitializeTracing(config);
    mirrorwatch::observability::InitializeMetrics(config);
    mirrorwatch::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = mirrorwatch::factory::Build(config);

    // Register signal handlers before starting anything to avoid a race window.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

#if MIRRORWATCH_ENABLE_GRPC
    mirrorwatch::runtime::Server server(config.server().bind_address(), std::move(app.grpc_services));
    server.Start();
#else
    MIRRORWATCH_LOG_WARN("built without gRPC, read API not served");
#endif

    app.scanner->Start();
    MIRRORWATCH_LOG_INFO("mirrorwatch started", {mirrorwatch::observability::StringField("bind_address", config.server().bind_address()),
                                                 mirrorwatch::observability::BoolField("health_checks",
                                                                                       !config.scanner().disable_health_checks())});

    while (g_running) std::this_thread::sleep_for(std::chrono::seconds(1));

    MIRRORWATCH_LOG_INFO("shutting down mirrorwatch");

    app.scanner->Stop();
#if MIRRORWATCH_ENABLE_GRPC
    server.Stop();
#endif
    ShutdownObservability();
  } catch (const std::exception& e) {
    MIRRORWATCH_LOG_ERROR("fatal error", {mirrorwatch::observability::StringField("error", e.what())});
    ShutdownObservability();
    return 2;
  }

  return 0;
}
