#include "internal/observability/otlp_exporter.hpp"

#ifdef OUTBOX_ENABLE_OTEL

#include <cstdlib>
#include <string_view>

#include "config/config.pb.h"

namespace outbox::observability {
namespace resource = opentelemetry::sdk::resource;
namespace cfg      = outbox::runtime::config;

namespace {

std::string StoreBackendName(const cfg::StoreConfig& store) {
  switch (store.backend_case()) {
    case cfg::StoreConfig::kSqlite:
      return "sqlite";
    case cfg::StoreConfig::kMemory:
      return "memory";
    default:
      return "file";
  }
}

std::string SinkName(const cfg::SinkConfig& sink) {
  return sink.target_case() == cfg::SinkConfig::kFile ? "file" : "log";
}

} // namespace

OtlpSettings OtlpSettings::FromConfig(const cfg::RuntimeConfig& config) {
  const auto& observability = config.observability();

  OtlpSettings settings;
  settings.endpoint  = observability.otlp_endpoint();
  settings.transport = observability.transport() == cfg::OTLP_TRANSPORT_HTTP ? OtlpTransport::kHttpProtobuf : OtlpTransport::kGrpc;
  settings.insecure  = std::string_view(settings.endpoint).substr(0, 8) != "https://";
  return settings;
}

std::string OtlpSettings::ResolveEndpoint(OtlpSignal signal) const {
  if (!endpoint.empty()) {
    return endpoint;
  }

  const bool traces = signal == OtlpSignal::kTraces;
  if (const char* env = std::getenv(traces ? "OTEL_EXPORTER_OTLP_TRACES_ENDPOINT" : "OTEL_EXPORTER_OTLP_METRICS_ENDPOINT")) {
    return env;
  }
  if (const char* env = std::getenv("OTEL_EXPORTER_OTLP_ENDPOINT")) {
    return env;
  }

  if (transport == OtlpTransport::kHttpProtobuf) {
    return traces ? "http://localhost:4318/v1/traces" : "http://localhost:4318/v1/metrics";
  }
  return "localhost:4317";
}

resource::Resource RelayResource(const cfg::RuntimeConfig& config) {
  resource::ResourceAttributes attrs = {
      {"service.name", std::string(kInstrumentationName)},
      {"service.version", std::string(kInstrumentationVersion)},
      {"outbox.store.backend", StoreBackendName(config.store())},
      {"outbox.sink", SinkName(config.sink())},
  };
  return resource::Resource::Create(attrs);
}

} // namespace outbox::observability

#endif
