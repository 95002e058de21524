#pragma once

#include <cstdlib>
#include <string>

#include "config/config.pb.h"
#include "internal/observability/spans.hpp"

namespace bridgewatch::observability {

// Endpoint precedence: config, signal-specific env var, OTEL_EXPORTER_OTLP_ENDPOINT, collector default.
inline std::string ResolveEndpoint(const OtlpConfig& config, const char* signal_env, const char* http_path) {
  if (!config.endpoint.empty()) {
    return config.endpoint;
  }

  if (const char* endpoint = std::getenv(signal_env)) {
    return endpoint;
  }
  if (const char* endpoint = std::getenv("OTEL_EXPORTER_OTLP_ENDPOINT")) {
    return endpoint;
  }

  return config.transport == OtlpTransport::kHttpProtobuf ? std::string("http://localhost:4318") + http_path : "localhost:4317";
}

inline OtlpConfig ToOtlpConfig(const bridgewatch::runtime::config::ObservabilityConfig& observability) {
  OtlpConfig otlp_config;
  otlp_config.endpoint = observability.otlp_endpoint();
  otlp_config.transport =
      observability.transport() == bridgewatch::runtime::config::OTLP_TRANSPORT_HTTP ? OtlpTransport::kHttpProtobuf : OtlpTransport::kGrpc;
  if (!observability.service_name().empty()) {
    otlp_config.service_name = observability.service_name();
  }
  if (observability.collection_interval_ms() > 0) {
    otlp_config.collection_interval_ms = observability.collection_interval_ms();
  }
  return otlp_config;
}

} // namespace bridgewatch::observability
