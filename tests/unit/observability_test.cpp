#include <cassert>
#include <cstdlib>
#include <iostream>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/otlp_export.hpp"

namespace {

namespace obs = mirrorwatch::observability;
using mirrorwatch::config::ConfigLoader;

void ClearOtlpEnvironment() {
  ::unsetenv("OTEL_EXPORTER_OTLP_ENDPOINT");
  ::unsetenv("OTEL_EXPORTER_OTLP_TRACES_ENDPOINT");
  ::unsetenv("OTEL_EXPORTER_OTLP_METRICS_ENDPOINT");
}

void TestPlainFieldsAreNotQuoted() {
  const auto line = obs::FormatLogLine("probe finished", {obs::StringField("domain", "a.example"), obs::IntField("status", 200),
                                                          obs::BoolField("healthy", true), obs::DoubleField("ms", 12.345)});
  assert(line == "probe finished domain=a.example status=200 healthy=true ms=12.3");
}

void TestMessagesWithSpacesAreQuoted() {
  const auto line = obs::FormatLogLine("probe failed", {obs::StringField("error", "HTTP 503: \"Service\" down\nretry"), obs::StringField("body", "")});
  assert(line == "probe failed error=\"HTTP 503: \\\"Service\\\" down\\nretry\" body=\"\"");
}

void TestNoFields() {
  assert(obs::FormatLogLine("shutting down", {}) == "shutting down");
}

void TestLogLevels() {
  assert(obs::ParseLogLevel("debug") == spdlog::level::debug);
  assert(obs::ParseLogLevel("WARNING") == spdlog::level::warn);
  assert(obs::ParseLogLevel("error") == spdlog::level::err);
  assert(obs::ParseLogLevel("off") == spdlog::level::off);
  assert(!obs::ParseLogLevel("loud").has_value());
}

void TestGrpcExportDefaults() {
  ClearOtlpEnvironment();
  auto config   = ConfigLoader::LoadFromYamlString("");
  auto settings = obs::ResolveExportSettings(config, obs::OtlpSignal::kTraces);
  assert(settings.transport == obs::OtlpTransport::kGrpc);
  assert(settings.endpoint == "localhost:4317");
  assert(settings.insecure);
  assert(settings.resource.size() == 3);
  assert(settings.resource[0].first == "service.name");
  assert(settings.resource[0].second == "mirrorwatch");
  assert(settings.resource[2].first == "mirrorwatch.site_url");
  assert(settings.resource[2].second == "http://localhost");
}

void TestHttpEndpointGetsSignalPath() {
  ClearOtlpEnvironment();
  auto config = ConfigLoader::LoadFromYamlString(R"(observability:
  transport: "OTLP_TRANSPORT_HTTP"
  otlp_endpoint: "https://collector.example:4318/"
scanner:
  site_url: "https://status.example"
)");
  auto metrics = obs::ResolveExportSettings(config, obs::OtlpSignal::kMetrics);
  assert(metrics.transport == obs::OtlpTransport::kHttpProtobuf);
  assert(metrics.endpoint == "https://collector.example:4318/v1/metrics");
  assert(!metrics.insecure);
  assert(metrics.resource.back().first == "mirrorwatch.site_url");
  assert(metrics.resource.back().second == "https://status.example");

  auto traces = obs::ResolveExportSettings(config, obs::OtlpSignal::kTraces);
  assert(traces.endpoint == "https://collector.example:4318/v1/traces");
}

void TestEnvironmentFallback() {
  ClearOtlpEnvironment();
  ::setenv("OTEL_EXPORTER_OTLP_ENDPOINT", "collector:4317", 1);
  ::setenv("OTEL_EXPORTER_OTLP_METRICS_ENDPOINT", "metrics-collector:4317", 1);

  auto config = ConfigLoader::LoadFromYamlString("");
  assert(obs::ResolveExportSettings(config, obs::OtlpSignal::kTraces).endpoint == "collector:4317");
  assert(obs::ResolveExportSettings(config, obs::OtlpSignal::kMetrics).endpoint == "metrics-collector:4317");

  // configured endpoint wins
  auto pinned = ConfigLoader::LoadFromYamlString("observability:\n  otlp_endpoint: \"otel:4317\"\n");
  assert(obs::ResolveExportSettings(pinned, obs::OtlpSignal::kTraces).endpoint == "otel:4317");
  ClearOtlpEnvironment();
}

} // namespace

int main() {
  TestPlainFieldsAreNotQuoted();
  TestMessagesWithSpacesAreQuoted();
  TestNoFields();
  TestLogLevels();
  TestGrpcExportDefaults();
  TestHttpEndpointGetsSignalPath();
  TestEnvironmentFallback();

  std::cout << "observability_test: pass\n";
  return 0;
}
