#pragma once

#ifdef OUTBOX_ENABLE_OTEL

#include <opentelemetry/sdk/resource/resource.h>

#include <string>

namespace outbox::runtime::config {
class RuntimeConfig;
}

namespace outbox::observability {

enum class OtlpTransport {
  kGrpc,
  kHttpProtobuf,
};

enum class OtlpSignal {
  kTraces,
  kMetrics,
};

/*
  Exporter settings shared by the trace and metric pipelines.

  insecure follows the endpoint: plaintext unless it is an https:// URL.
*/
struct OtlpSettings {
  std::string   endpoint;
  OtlpTransport transport = OtlpTransport::kGrpc;
  bool          insecure  = true;

  static OtlpSettings FromConfig(const outbox::runtime::config::RuntimeConfig& config);

  // explicit endpoint, then OTEL_EXPORTER_OTLP_<SIGNAL>_ENDPOINT, then
  // OTEL_EXPORTER_OTLP_ENDPOINT, then the collector default for the transport
  std::string ResolveEndpoint(OtlpSignal signal) const;
};

// service.name / service.version plus the store backend and sink the relay
// was configured with, so exported data can be told apart per deployment
opentelemetry::sdk::resource::Resource RelayResource(const outbox::runtime::config::RuntimeConfig& config);

// instrumentation scope name and version for tracers and meters
inline constexpr const char* kInstrumentationName    = "outbox-relay";
inline constexpr const char* kInstrumentationVersion = OUTBOX_VERSION;

} // namespace outbox::observability

#endif
