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
#define BRIDGEWATCH_OTEL_METRIC_READER_FACTORY 1
#include <opentelemetry/sdk/metrics/periodic_exporting_metric_reader_factory.h>
#elif __has_include(<opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>)
#define BRIDGEWATCH_OTEL_METRIC_READER_FACTORY 1
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#elif __has_include(<opentelemetry/sdk/metrics/periodic_exporting_metric_reader.h>)
#include <opentelemetry/sdk/metrics/periodic_exporting_metric_reader.h>
#else
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader.h>
#endif
#include <opentelemetry/sdk/resource/resource.h>

#include "config/config.pb.h"
#include "internal/observability/otlp_config.hpp"

namespace bridgewatch::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;
namespace resource    = opentelemetry::sdk::resource;

namespace {
using AttributePair = std::pair<opentelemetry::nostd::string_view, opentelemetry::common::AttributeValue>;
std::shared_ptr<sdkmetrics::MeterProvider> g_provider;

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

template <typename Instrument, typename Value, typename Attributes>
void AddWithAttributes(const opentelemetry::nostd::shared_ptr<Instrument>& instrument, Value value, Attributes&& attributes) {
  if constexpr (requires { instrument->Add(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{}); }) {
    instrument->Add(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{});
  } else {
    instrument->Add(value, std::forward<Attributes>(attributes));
  }
}

template <typename Instrument, typename Value, typename Attributes>
void RecordWithAttributes(const opentelemetry::nostd::shared_ptr<Instrument>& instrument, Value value, Attributes&& attributes) {
  if constexpr (requires { instrument->Record(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{}); }) {
    instrument->Record(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{});
  } else {
    instrument->Record(value, std::forward<Attributes>(attributes));
  }
}

} // namespace

struct Metrics::Impl {
  opentelemetry::nostd::shared_ptr<metrics_api::Meter> meter;

  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> scored_count;
  opentelemetry::nostd::shared_ptr<metrics_api::Histogram<double>>      cycle_latency_ms;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> reconnect_count;
  opentelemetry::nostd::shared_ptr<metrics_api::Counter<std::uint64_t>> insert_count;
  opentelemetry::nostd::shared_ptr<metrics_api::ObservableInstrument>   anomaly_total_gauge;

  std::atomic<std::int64_t> anomaly_total{0};
};

bool InitializeMetrics(const bridgewatch::runtime::config::RuntimeConfig& config) {
  const auto& observability = config.observability();
  if (!observability.metrics_enabled()) {
    ShutdownMetrics();
    return false;
  }

  auto otlp_config = ToOtlpConfig(observability);
  auto endpoint    = ResolveEndpoint(otlp_config, "OTEL_EXPORTER_OTLP_METRICS_ENDPOINT", "/v1/metrics");

  std::unique_ptr<sdkmetrics::PushMetricExporter> exporter;
  if (otlp_config.transport == OtlpTransport::kHttpProtobuf) {
    otlp::OtlpHttpMetricExporterOptions options;
    options.url = endpoint;
    exporter    = otlp::OtlpHttpMetricExporterFactory::Create(options);
  } else {
    otlp::OtlpGrpcMetricExporterOptions options;
    options.endpoint            = endpoint;
    options.use_ssl_credentials = !otlp_config.insecure;
    exporter                    = otlp::OtlpGrpcMetricExporterFactory::Create(options);
  }

  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  reader_options.export_interval_millis = std::chrono::milliseconds(otlp_config.collection_interval_ms);

#ifdef BRIDGEWATCH_OTEL_METRIC_READER_FACTORY
  auto reader = sdkmetrics::PeriodicExportingMetricReaderFactory::Create(std::move(exporter), reader_options);
#else
  auto reader = std::make_unique<sdkmetrics::PeriodicExportingMetricReader>(std::move(exporter), reader_options);
#endif

  auto resource = resource::Resource::Create({{"service.name", otlp_config.service_name}});
  g_provider    = std::make_shared<sdkmetrics::MeterProvider>(std::unique_ptr<sdkmetrics::ViewRegistry>(new sdkmetrics::ViewRegistry()), resource);
  ConfigureResource(*g_provider, resource);
  AddMetricReaderCompat(g_provider, std::move(reader));

  metrics_api::Provider::SetMeterProvider(opentelemetry::nostd::shared_ptr<metrics_api::MeterProvider>(g_provider));
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
  auto provider = metrics_api::Provider::GetMeterProvider();
  impl_->meter  = provider->GetMeter("bridgewatch", "0.1.0");

  impl_->scored_count     = impl_->meter->CreateUInt64Counter("bridgewatch.records.scored", "1", "Records scored, by outcome");
  impl_->cycle_latency_ms = impl_->meter->CreateDoubleHistogram("bridgewatch.scoring.cycle_ms", "ms", "Duration of scoring cycles that found work");
  impl_->reconnect_count  = impl_->meter->CreateUInt64Counter("bridgewatch.store.reconnects", "1", "Store reconnect attempts");
  impl_->insert_count     = impl_->meter->CreateUInt64Counter("bridgewatch.records.inserted", "1", "Records inserted by replay and seed");
  impl_->anomaly_total_gauge =
      impl_->meter->CreateInt64ObservableGauge("bridgewatch.records.anomalies", "Anomalous records in the store at the last count", "1");
  impl_->anomaly_total_gauge->AddCallback(
      [](metrics_api::ObserverResult result, void* state) {
        auto* impl       = static_cast<Impl*>(state);
        auto  int_result = opentelemetry::nostd::get<opentelemetry::nostd::shared_ptr<metrics_api::ObserverResultT<std::int64_t>>>(result);
        int_result->Observe(impl->anomaly_total.load());
      },
      impl_.get());
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordScored(bool is_anomaly, std::uint64_t count) {
  if (!impl_ || !impl_->scored_count || count == 0) {
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"anomaly", is_anomaly}};
  AddWithAttributes(impl_->scored_count, count, attributes);
}

void Metrics::ObserveCycleLatencyMs(double latency_ms) {
  if (!impl_ || !impl_->cycle_latency_ms) {
    return;
  }

  RecordWithAttributes(impl_->cycle_latency_ms, latency_ms, std::initializer_list<AttributePair>{});
}

void Metrics::RecordReconnect(bool success) {
  if (!impl_ || !impl_->reconnect_count) {
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"success", success}};
  AddWithAttributes(impl_->reconnect_count, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::RecordInsert(std::string_view source, bool success) {
  if (!impl_ || !impl_->insert_count) {
    return;
  }

  const std::initializer_list<AttributePair> attributes = {{"source", opentelemetry::nostd::string_view(source.data(), source.size())}, {"success", success}};
  AddWithAttributes(impl_->insert_count, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::SetAnomalyTotal(std::uint64_t anomalies) {
  if (!impl_) {
    return;
  }

  impl_->anomaly_total.store(static_cast<std::int64_t>(anomalies));
}

} // namespace bridgewatch::observability

#endif
