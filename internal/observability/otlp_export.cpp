#include "internal/observability/otlp_export.hpp"

#include <cstdlib>
#include <string_view>

#include "config/config.pb.h"

namespace mirrorwatch::observability {
namespace {

constexpr const char* kServiceName    = "mirrorwatch";
constexpr const char* kServiceVersion = "0.1.0";

std::string_view SignalPath(OtlpSignal signal) {
  return signal == OtlpSignal::kTraces ? "/v1/traces" : "/v1/metrics";
}

std::string FromEnvironment(OtlpSignal signal) {
  const char* specific = std::getenv(signal == OtlpSignal::kTraces ? "OTEL_EXPORTER_OTLP_TRACES_ENDPOINT" : "OTEL_EXPORTER_OTLP_METRICS_ENDPOINT");
  if (specific != nullptr && *specific != '\0') return specific;

  const char* shared = std::getenv("OTEL_EXPORTER_OTLP_ENDPOINT");
  if (shared != nullptr && *shared != '\0') return shared;
  return {};
}

bool EndsWith(std::string_view value, std::string_view suffix) {
  return value.size() >= suffix.size() && value.substr(value.size() - suffix.size()) == suffix;
}

} // namespace

ExportSettings ResolveExportSettings(const mirrorwatch::runtime::config::RuntimeConfig& config, OtlpSignal signal) {
  const auto& observability = config.observability();

  ExportSettings settings;
  settings.transport =
      observability.transport() == mirrorwatch::runtime::config::OTLP_TRANSPORT_HTTP ? OtlpTransport::kHttpProtobuf : OtlpTransport::kGrpc;

  settings.endpoint = observability.otlp_endpoint();
  if (settings.endpoint.empty()) settings.endpoint = FromEnvironment(signal);

  if (settings.transport == OtlpTransport::kHttpProtobuf) {
    if (settings.endpoint.empty()) settings.endpoint = "http://localhost:4318";
    while (!settings.endpoint.empty() && settings.endpoint.back() == '/') settings.endpoint.pop_back();
    if (!EndsWith(settings.endpoint, SignalPath(signal))) settings.endpoint += SignalPath(signal);
  } else if (settings.endpoint.empty()) {
    settings.endpoint = "localhost:4317";
  }

  settings.insecure = settings.endpoint.rfind("https://", 0) != 0;

  // scanner.site_url is always set once defaults are applied.
  settings.resource = {
      {"service.name", kServiceName}, {"service.version", kServiceVersion}, {"mirrorwatch.site_url", config.scanner().site_url()}};
  return settings;
}

} // namespace mirrorwatch::observability
