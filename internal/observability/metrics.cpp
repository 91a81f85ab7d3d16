#include "internal/observability/spans.hpp"

#ifdef ENABLE_OTEL

#include <opentelemetry/common/attribute_value.h>
#include <opentelemetry/context/context.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_options.h>
#include <opentelemetry/metrics/provider.h>
#include <opentelemetry/sdk/metrics/meter_provider.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <utility>
#if __has_include(<opentelemetry/sdk/metrics/periodic_exporting_metric_reader_factory.h>)
#define MIRRORWATCH_OTEL_METRIC_READER_FACTORY 1
#include <opentelemetry/sdk/metrics/periodic_exporting_metric_reader_factory.h>
#elif __has_include(<opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>)
#define MIRRORWATCH_OTEL_METRIC_READER_FACTORY 1
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#elif __has_include(<opentelemetry/sdk/metrics/periodic_exporting_metric_reader.h>)
#include <opentelemetry/sdk/metrics/periodic_exporting_metric_reader.h>
#else
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader.h>
#endif
#include <opentelemetry/sdk/resource/resource.h>

#include "config/config.pb.h"
#include "internal/observability/otlp_export.hpp"

namespace mirrorwatch::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;
namespace resource    = opentelemetry::sdk::resource;

namespace {

using AttributePair = std::pair<opentelemetry::nostd::string_view, opentelemetry::common::AttributeValue>;

template <typename T>
using Instrument = opentelemetry::nostd::shared_ptr<T>;

std::shared_ptr<sdkmetrics::MeterProvider> g_provider;

// Instrument groups switchable from observability.metrics.
struct EnabledGroups {
  std::atomic<bool> probe{true};
  std::atomic<bool> loop{true};
  std::atomic<bool> fleet{true};
};

EnabledGroups g_groups;

template <typename Provider>
void ConfigureResource(Provider& provider, const resource::Resource& res) {
  if constexpr (requires { provider.SetResource(res); }) {
    provider.SetResource(res);
  }
}

template <typename Provider>
void AddMetricReaderCompat(const std::shared_ptr<Provider>& provider, std::unique_ptr<sdkmetrics::MetricReader> reader) {
  if constexpr (requires { provider->AddMetricReader(std::move(reader)); }) {
    provider->AddMetricReader(std::move(reader));
  } else {
    provider->AddMetricReader(std::shared_ptr<sdkmetrics::MetricReader>(std::move(reader)));
  }
}

// Counter::Add and Histogram::Record grew a context parameter across SDK releases.
template <typename T, typename Value>
void Count(const Instrument<metrics_api::Counter<T>>& counter, Value value, std::initializer_list<AttributePair> attributes) {
  if (!counter) return;
  if constexpr (requires { counter->Add(value, attributes, opentelemetry::context::Context{}); }) {
    counter->Add(value, attributes, opentelemetry::context::Context{});
  } else {
    counter->Add(value, attributes);
  }
}

void Observe(const Instrument<metrics_api::Histogram<double>>& histogram, double value, std::initializer_list<AttributePair> attributes) {
  if (!histogram) return;
  if constexpr (requires { histogram->Record(value, attributes, opentelemetry::context::Context{}); }) {
    histogram->Record(value, attributes, opentelemetry::context::Context{});
  } else {
    histogram->Record(value, attributes);
  }
}

std::unique_ptr<sdkmetrics::PushMetricExporter> BuildExporter(const ExportSettings& settings) {
  if (settings.transport == OtlpTransport::kHttpProtobuf) {
    otlp::OtlpHttpMetricExporterOptions options;
    options.url = settings.endpoint;
    return otlp::OtlpHttpMetricExporterFactory::Create(options);
  }
  otlp::OtlpGrpcMetricExporterOptions options;
  options.endpoint            = settings.endpoint;
  options.use_ssl_credentials = !settings.insecure;
  return otlp::OtlpGrpcMetricExporterFactory::Create(options);
}

resource::Resource BuildResource(const ExportSettings& settings) {
  resource::ResourceAttributes attrs;
  for (const auto& [key, value] : settings.resource) {
    attrs.SetAttribute(key, opentelemetry::nostd::string_view(value));
  }
  return resource::Resource::Create(attrs);
}

} // namespace

struct Metrics::Impl {
  Instrument<metrics_api::Meter> meter;

  Instrument<metrics_api::Counter<std::uint64_t>> probes;
  Instrument<metrics_api::Histogram<double>>      probe_latency_ms;
  Instrument<metrics_api::Counter<std::uint64_t>> deadline_expired;
  Instrument<metrics_api::Histogram<double>>      loop_duration_ms;
  Instrument<metrics_api::Counter<std::uint64_t>> stats_polls;
  Instrument<metrics_api::Counter<std::uint64_t>> requests;
  Instrument<metrics_api::ObservableInstrument>   fleet;

  std::atomic<std::int64_t> fleet_enabled{0};
  std::atomic<std::int64_t> fleet_healthy{0};
};

bool InitializeMetrics(const mirrorwatch::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();
  if (!observability.metrics_enabled()) {
    ShutdownMetrics();
    return false;
  }

  const auto  settings = ResolveExportSettings(config, OtlpSignal::kMetrics);
  const auto& groups   = observability.metrics();

  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  reader_options.export_interval_millis = std::chrono::milliseconds(groups.collection_interval_ms() > 0 ? groups.collection_interval_ms() : 10000);
  if (groups.export_timeout_ms() > 0) {
    reader_options.export_timeout_millis = std::chrono::milliseconds(groups.export_timeout_ms());
  }

#ifdef MIRRORWATCH_OTEL_METRIC_READER_FACTORY
  auto reader = sdkmetrics::PeriodicExportingMetricReaderFactory::Create(BuildExporter(settings), reader_options);
#else
  auto reader = std::make_unique<sdkmetrics::PeriodicExportingMetricReader>(BuildExporter(settings), reader_options);
#endif

  auto res   = BuildResource(settings);
  g_provider = std::make_shared<sdkmetrics::MeterProvider>(std::unique_ptr<sdkmetrics::ViewRegistry>(new sdkmetrics::ViewRegistry()), res);
  ConfigureResource(*g_provider, res);
  AddMetricReaderCompat(g_provider, std::move(reader));
  metrics_api::Provider::SetMeterProvider(opentelemetry::nostd::shared_ptr<metrics_api::MeterProvider>(g_provider));

  g_groups.probe = groups.probe_metrics_enabled();
  g_groups.loop  = groups.loop_metrics_enabled();
  g_groups.fleet = groups.fleet_metrics_enabled();
  return true;
}

void ShutdownMetrics() {
  if (g_provider) {
    g_provider->ForceFlush();
    g_provider->Shutdown();
  }
  g_provider.reset();
}

Metrics::Metrics() : impl_(std::make_unique<Impl>()) {
  impl_->meter = metrics_api::Provider::GetMeterProvider()->GetMeter("mirrorwatch", "0.1.0");

  auto& m                 = *impl_->meter;
  impl_->probes           = m.CreateUInt64Counter("mirrorwatch.probe.count", "Completed health probes by outcome", "1");
  impl_->probe_latency_ms = m.CreateDoubleHistogram("mirrorwatch.probe.latency_ms", "Profile page response time", "ms");
  impl_->deadline_expired = m.CreateUInt64Counter("mirrorwatch.probe.deadline_expired", "Probes not started before the tick deadline", "1");
  impl_->loop_duration_ms = m.CreateDoubleHistogram("mirrorwatch.loop.duration_ms", "Duration of one background loop pass", "ms");
  impl_->stats_polls      = m.CreateUInt64Counter("mirrorwatch.stats.polls", "Statistics endpoint polls by outcome", "1");
  impl_->requests         = m.CreateUInt64Counter("mirrorwatch.api.requests", "Read API requests", "1");
  impl_->fleet            = m.CreateInt64ObservableGauge("mirrorwatch.fleet.instances", "Monitored instances by state", "1");
  impl_->fleet->AddCallback(
      [](metrics_api::ObserverResult result, void* state) {
        auto* impl     = static_cast<Impl*>(state);
        auto  observer = opentelemetry::nostd::get<opentelemetry::nostd::shared_ptr<metrics_api::ObserverResultT<std::int64_t>>>(result);
        observer->Observe(impl->fleet_enabled.load(), std::initializer_list<AttributePair>{{"state", "enabled"}});
        observer->Observe(impl->fleet_healthy.load(), std::initializer_list<AttributePair>{{"state", "healthy"}});
      },
      impl_.get());
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordProbe(std::string_view outcome) {
  if (!g_groups.probe) return;
  const std::string value(outcome);
  Count(impl_->probes, std::uint64_t{1}, {{"outcome", value}});
}

void Metrics::ObserveProbeLatencyMs(double latency_ms) {
  if (!g_groups.probe) return;
  Observe(impl_->probe_latency_ms, latency_ms, {});
}

void Metrics::RecordDeadlineExpired(std::uint64_t count) {
  if (!g_groups.probe || count == 0) return;
  Count(impl_->deadline_expired, count, {});
}

void Metrics::ObserveLoopDurationMs(std::string_view loop, double duration_ms) {
  if (!g_groups.loop) return;
  const std::string value(loop);
  Observe(impl_->loop_duration_ms, duration_ms, {{"loop", value}});
}

void Metrics::SetFleetGauge(std::uint64_t enabled, std::uint64_t healthy) {
  if (!g_groups.fleet) return;
  impl_->fleet_enabled.store(static_cast<std::int64_t>(enabled));
  impl_->fleet_healthy.store(static_cast<std::int64_t>(healthy));
}

void Metrics::RecordStatsPolls(std::string_view outcome, std::uint64_t count) {
  if (!g_groups.loop || count == 0) return;
  const std::string value(outcome);
  Count(impl_->stats_polls, count, {{"outcome", value}});
}

void Metrics::RecordRequest(std::string_view route, bool success) {
  const std::string value(route);
  Count(impl_->requests, std::uint64_t{1}, {{"route", value}, {"success", success}});
}

} // namespace mirrorwatch::observability

#endif
