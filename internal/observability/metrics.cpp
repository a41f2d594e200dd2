#include "internal/observability/spans.hpp"

#ifdef OUTBOX_ENABLE_OTEL

#include <opentelemetry/common/attribute_value.h>
#include <opentelemetry/context/context.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_grpc_metric_exporter_options.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_factory.h>
#include <opentelemetry/exporters/otlp/otlp_http_metric_exporter_options.h>
#include <opentelemetry/metrics/provider.h>
#include <opentelemetry/sdk/metrics/export/periodic_exporting_metric_reader_factory.h>
#include <opentelemetry/sdk/metrics/meter_provider.h>

#include <chrono>
#include <memory>
#include <string>
#include <utility>

#include "config/config.pb.h"
#include "internal/observability/otlp_exporter.hpp"

namespace outbox::observability {
namespace otlp        = opentelemetry::exporter::otlp;
namespace metrics_api = opentelemetry::metrics;
namespace sdkmetrics  = opentelemetry::sdk::metrics;

namespace {
using AttributePair = std::pair<opentelemetry::nostd::string_view, opentelemetry::common::AttributeValue>;
std::shared_ptr<sdkmetrics::MeterProvider> g_provider;

template <typename Provider>
void AddMetricReaderCompat(const std::shared_ptr<Provider>& provider, std::unique_ptr<sdkmetrics::MetricReader> reader) {
  if constexpr (requires { provider->AddMetricReader(std::move(reader)); }) {
    provider->AddMetricReader(std::move(reader));
  } else {
    provider->AddMetricReader(std::shared_ptr<sdkmetrics::MetricReader>(std::move(reader)));
  }
}

template <typename Instrument, typename Value, typename Attributes>
void AddWithAttributes(const opentelemetry::nostd::unique_ptr<Instrument>& instrument, Value value, Attributes&& attributes) {
  if constexpr (requires { instrument->Add(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{}); }) {
    instrument->Add(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{});
  } else {
    instrument->Add(value, std::forward<Attributes>(attributes));
  }
}

template <typename Instrument, typename Value, typename Attributes>
void RecordWithAttributes(const opentelemetry::nostd::unique_ptr<Instrument>& instrument, Value value, Attributes&& attributes) {
  if constexpr (requires { instrument->Record(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{}); }) {
    instrument->Record(value, std::forward<Attributes>(attributes), opentelemetry::context::Context{});
  } else {
    instrument->Record(value, std::forward<Attributes>(attributes));
  }
}

} // namespace

struct Metrics::Impl {
  opentelemetry::nostd::shared_ptr<metrics_api::Meter> meter;

  opentelemetry::nostd::unique_ptr<metrics_api::Counter<std::uint64_t>> delivery_attempts;
  opentelemetry::nostd::unique_ptr<metrics_api::Histogram<double>>      delivery_latency_ms;
  opentelemetry::nostd::unique_ptr<metrics_api::Histogram<double>>      retry_delay_ms;
  opentelemetry::nostd::unique_ptr<metrics_api::Counter<std::uint64_t>> event_terminal;
  opentelemetry::nostd::unique_ptr<metrics_api::Counter<std::uint64_t>> store_errors;
};

bool InitializeMetrics(const outbox::runtime::config::RuntimeConfig& config) {
  if (!config.observability().metrics_enabled()) {
    ShutdownMetrics();
    return false;
  }

  const auto settings = OtlpSettings::FromConfig(config);
  const auto endpoint = settings.ResolveEndpoint(OtlpSignal::kMetrics);

  std::unique_ptr<sdkmetrics::PushMetricExporter> exporter;
  if (settings.transport == OtlpTransport::kHttpProtobuf) {
    otlp::OtlpHttpMetricExporterOptions options;
    options.url = endpoint;
    exporter    = otlp::OtlpHttpMetricExporterFactory::Create(options);
  } else {
    otlp::OtlpGrpcMetricExporterOptions options;
    options.endpoint            = endpoint;
    options.use_ssl_credentials = !settings.insecure;
    exporter                    = otlp::OtlpGrpcMetricExporterFactory::Create(options);
  }

  sdkmetrics::PeriodicExportingMetricReaderOptions reader_options;
  reader_options.export_interval_millis = std::chrono::milliseconds(1000);
  auto reader = sdkmetrics::PeriodicExportingMetricReaderFactory::Create(std::move(exporter), reader_options);

  g_provider = std::make_shared<sdkmetrics::MeterProvider>(std::unique_ptr<sdkmetrics::ViewRegistry>(new sdkmetrics::ViewRegistry()),
                                                           RelayResource(config));
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
  impl_->meter  = provider->GetMeter(kInstrumentationName, kInstrumentationVersion);

  impl_->delivery_attempts   = impl_->meter->CreateUInt64Counter("outbox.delivery.attempts", "Sink delivery attempts by outcome", "1");
  impl_->delivery_latency_ms = impl_->meter->CreateDoubleHistogram("outbox.delivery.latency_ms", "Sink delivery latency", "ms");
  impl_->retry_delay_ms      = impl_->meter->CreateDoubleHistogram("outbox.retry.delay_ms", "Backoff waited before a retry", "ms");
  impl_->event_terminal      = impl_->meter->CreateUInt64Counter("outbox.event.terminal", "Events reaching a terminal state", "1");
  impl_->store_errors        = impl_->meter->CreateUInt64Counter("outbox.store.errors", "Failed outbox store operations", "1");
}

Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

void Metrics::RecordDeliveryAttempt(std::string_view sink, std::string_view outcome) {
  if (!impl_ || !impl_->delivery_attempts) {
    return;
  }

  const std::string                          sink_label(sink);
  const std::string                          outcome_label(outcome);
  const std::initializer_list<AttributePair> attributes = {{"sink", sink_label}, {"outcome", outcome_label}};
  AddWithAttributes(impl_->delivery_attempts, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::ObserveDeliveryLatencyMs(std::string_view sink, double latency_ms) {
  if (!impl_ || !impl_->delivery_latency_ms) {
    return;
  }

  const std::string                          sink_label(sink);
  const std::initializer_list<AttributePair> attributes = {{"sink", sink_label}};
  RecordWithAttributes(impl_->delivery_latency_ms, latency_ms, attributes);
}

void Metrics::ObserveRetryDelayMs(double delay_ms) {
  if (!impl_ || !impl_->retry_delay_ms) {
    return;
  }

  RecordWithAttributes(impl_->retry_delay_ms, delay_ms, std::initializer_list<AttributePair>{});
}

void Metrics::RecordEventTerminal(std::string_view terminal) {
  if (!impl_ || !impl_->event_terminal) {
    return;
  }

  const std::string                          terminal_label(terminal);
  const std::initializer_list<AttributePair> attributes = {{"terminal", terminal_label}};
  AddWithAttributes(impl_->event_terminal, static_cast<std::uint64_t>(1), attributes);
}

void Metrics::RecordStoreError(std::string_view operation) {
  if (!impl_ || !impl_->store_errors) {
    return;
  }

  const std::string                          op_label(operation);
  const std::initializer_list<AttributePair> attributes = {{"operation", op_label}};
  AddWithAttributes(impl_->store_errors, static_cast<std::uint64_t>(1), attributes);
}

} // namespace outbox::observability

#endif
