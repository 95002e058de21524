#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace bridgewatch::runtime::config {
class RuntimeConfig;
}

namespace bridgewatch::observability {

enum class OtlpTransport {
  kGrpc,
  kHttpProtobuf,
};

struct OtlpConfig {
  std::string   service_name{"bridgewatch"};
  std::string   endpoint{};
  OtlpTransport transport{OtlpTransport::kGrpc};
  bool          insecure{true};
  std::uint32_t collection_interval_ms{1000};
};

bool InitializeTracing(const bridgewatch::runtime::config::RuntimeConfig& config);
bool InitializeMetrics(const bridgewatch::runtime::config::RuntimeConfig& config);
void ShutdownTracing();
void ShutdownMetrics();

/*
  One span per unit of pipeline work: a training fit, a scoring cycle, a
  seed run. The span is active for the scope's lifetime and ends with it.
*/
class SpanScope {
 public:
  explicit SpanScope(std::string_view name);
  ~SpanScope();

  SpanScope(const SpanScope&)            = delete;
  SpanScope& operator=(const SpanScope&) = delete;

  SpanScope(SpanScope&&) noexcept;
  SpanScope& operator=(SpanScope&&) noexcept;

  void SetAttribute(std::string_view key, std::int64_t value);
  void SetAttribute(std::string_view key, double value);

  // error status plus an "error" event carrying reason
  void MarkFailed(std::string_view reason);

 private:
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

class Metrics {
 public:
  static Metrics& Instance();

  void RecordScored(bool is_anomaly, std::uint64_t count);
  void ObserveCycleLatencyMs(double latency_ms);
  void RecordReconnect(bool success);
  void RecordInsert(std::string_view source, bool success);
  void SetAnomalyTotal(std::uint64_t anomalies);

 private:
  Metrics();
#ifdef ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef ENABLE_OTEL
inline bool InitializeTracing(const bridgewatch::runtime::config::RuntimeConfig&) {
  return false;
}

inline bool InitializeMetrics(const bridgewatch::runtime::config::RuntimeConfig&) {
  return false;
}

inline void ShutdownTracing() {
}

inline void ShutdownMetrics() {
}

inline SpanScope::SpanScope(std::string_view) {
}

inline SpanScope::~SpanScope() {
}

inline SpanScope::SpanScope(SpanScope&&) noexcept = default;

inline SpanScope& SpanScope::operator=(SpanScope&&) noexcept = default;

inline void SpanScope::SetAttribute(std::string_view, std::int64_t) {
}

inline void SpanScope::SetAttribute(std::string_view, double) {
}

inline void SpanScope::MarkFailed(std::string_view) {
}

inline Metrics::Metrics() {
}

inline Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

inline void Metrics::RecordScored(bool, std::uint64_t) {
}

inline void Metrics::ObserveCycleLatencyMs(double) {
}

inline void Metrics::RecordReconnect(bool) {
}

inline void Metrics::RecordInsert(std::string_view, bool) {
}

inline void Metrics::SetAnomalyTotal(std::uint64_t) {
}
#endif

} // namespace bridgewatch::observability
