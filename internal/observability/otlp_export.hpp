#pragma once

#include <string>
#include <utility>
#include <vector>

namespace mirrorwatch::runtime::config {
class RuntimeConfig;
}

namespace mirrorwatch::observability {

enum class OtlpTransport {
  kGrpc,
  kHttpProtobuf,
};

enum class OtlpSignal {
  kTraces,
  kMetrics,
};

/*
  Where one OTLP signal is exported to, resolved from the observability
  section with the standard OTEL_EXPORTER_OTLP_* variables as fallback.
  HTTP endpoints always carry the per-signal path.
*/
struct ExportSettings {
  std::string   endpoint;
  OtlpTransport transport{OtlpTransport::kGrpc};
  bool          insecure{true};

  // Resource attributes identifying this deployment.
  std::vector<std::pair<std::string, std::string>> resource;
};

ExportSettings ResolveExportSettings(const mirrorwatch::runtime::config::RuntimeConfig& config, OtlpSignal signal);

} // namespace mirrorwatch::observability
