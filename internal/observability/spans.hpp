#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace mirrorwatch::runtime::config {
class RuntimeConfig;
}

namespace mirrorwatch::observability {

// Both return false when the signal is disabled or compiled out.
bool InitializeTracing(const mirrorwatch::runtime::config::RuntimeConfig& config);
bool InitializeMetrics(const mirrorwatch::runtime::config::RuntimeConfig& config);
void ShutdownTracing();
void ShutdownMetrics();

/*
  Active span for the lifetime of the scope. Work done on behalf of one
  monitored instance passes its domain, which becomes the
  `mirrorwatch.instance` attribute.
*/
class SpanScope {
 public:
  explicit SpanScope(std::string_view name);
  SpanScope(std::string_view name, std::string_view instance_domain);
  ~SpanScope();

  SpanScope(const SpanScope&)            = delete;
  SpanScope& operator=(const SpanScope&) = delete;

  SpanScope(SpanScope&&) noexcept;
  SpanScope& operator=(SpanScope&&) noexcept;

  void SetAttribute(std::string_view key, std::string_view value);
  void SetAttribute(std::string_view key, std::int64_t value);
  void SetAttribute(std::string_view key, bool value);
  // Marks the span failed. Spans that end without this are OK.
  void RecordError(std::string_view description);

 private:
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

class Metrics {
 public:
  static Metrics& Instance();

  // outcome is "healthy" or an error category name.
  void RecordProbe(std::string_view outcome);
  void ObserveProbeLatencyMs(double latency_ms);
  // Probes dropped because a tick reached its deadline before they started.
  void RecordDeadlineExpired(std::uint64_t count);
  void ObserveLoopDurationMs(std::string_view loop, double duration_ms);
  void SetFleetGauge(std::uint64_t enabled, std::uint64_t healthy);
  // outcome is "stored", "unavailable" or "failed".
  void RecordStatsPolls(std::string_view outcome, std::uint64_t count);
  // route is the read API method name.
  void RecordRequest(std::string_view route, bool success);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeTracing(const mirrorwatch::runtime::config::RuntimeConfig&) {
  return false;
}

inline bool InitializeMetrics(const mirrorwatch::runtime::config::RuntimeConfig&) {
  return false;
}

inline void ShutdownTracing() {
}

inline void ShutdownMetrics() {
}

inline SpanScope::SpanScope(std::string_view) {
}

inline SpanScope::SpanScope(std::string_view, std::string_view) {
}

inline SpanScope::~SpanScope() {
}

inline SpanScope::SpanScope(SpanScope&&) noexcept = default;

inline SpanScope& SpanScope::operator=(SpanScope&&) noexcept = default;

inline void SpanScope::SetAttribute(std::string_view, std::string_view) {
}

inline void SpanScope::SetAttribute(std::string_view, std::int64_t) {
}

inline void SpanScope::SetAttribute(std::string_view, bool) {
}

inline void SpanScope::RecordError(std::string_view) {
}

inline Metrics::Metrics() {
}

inline Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

inline void Metrics::RecordProbe(std::string_view) {
}

inline void Metrics::ObserveProbeLatencyMs(double) {
}

inline void Metrics::RecordDeadlineExpired(std::uint64_t) {
}

inline void Metrics::ObserveLoopDurationMs(std::string_view, double) {
}

inline void Metrics::SetFleetGauge(std::uint64_t, std::uint64_t) {
}

inline void Metrics::RecordStatsPolls(std::string_view, std::uint64_t) {
}

inline void Metrics::RecordRequest(std::string_view, bool) {
}
#endif

} // namespace mirrorwatch::observability
