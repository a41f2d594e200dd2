#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

namespace outbox::runtime::config {
class RuntimeConfig;
}

namespace outbox::observability {

bool InitializeTracing(const outbox::runtime::config::RuntimeConfig& config);
bool InitializeMetrics(const outbox::runtime::config::RuntimeConfig& config);
void ShutdownTracing();
void ShutdownMetrics();

/*
  RAII span. One per delivery task, with an event per attempt.
  Without OUTBOX_ENABLE_OTEL every member is an inline no-op.
*/
class SpanScope {
 public:
  explicit SpanScope(std::string_view name);
  ~SpanScope();

  SpanScope(const SpanScope&)            = delete;
  SpanScope& operator=(const SpanScope&) = delete;

  SpanScope(SpanScope&&) noexcept;
  SpanScope& operator=(SpanScope&&) noexcept;

  void SetAttribute(std::string_view key, std::string_view value);
  void SetAttribute(std::string_view key, std::int64_t value);
  void AddEvent(std::string_view name);
  void RecordException(std::string_view description);

 private:
#ifdef OUTBOX_ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

class Metrics {
 public:
  static Metrics& Instance();

  // outcome: delivered | transient | permanent | timeout
  void RecordDeliveryAttempt(std::string_view sink, std::string_view outcome);
  void ObserveDeliveryLatencyMs(std::string_view sink, double latency_ms);
  void ObserveRetryDelayMs(double delay_ms);
  // terminal: processed | failed | retries_exhausted
  void RecordEventTerminal(std::string_view terminal);
  void RecordStoreError(std::string_view operation);

 private:
  Metrics();
#ifdef OUTBOX_ENABLE_OTEL
  struct Impl;
  std::unique_ptr<Impl> impl_;
#endif
};

#ifndef OUTBOX_ENABLE_OTEL
inline bool InitializeTracing(const outbox::runtime::config::RuntimeConfig&) {
  return false;
}

inline bool InitializeMetrics(const outbox::runtime::config::RuntimeConfig&) {
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

inline void SpanScope::SetAttribute(std::string_view, std::string_view) {
}

inline void SpanScope::SetAttribute(std::string_view, std::int64_t) {
}

inline void SpanScope::AddEvent(std::string_view) {
}

inline void SpanScope::RecordException(std::string_view) {
}

inline Metrics::Metrics() {
}

inline Metrics& Metrics::Instance() {
  static Metrics instance;
  return instance;
}

inline void Metrics::RecordDeliveryAttempt(std::string_view, std::string_view) {
}

inline void Metrics::ObserveDeliveryLatencyMs(std::string_view, double) {
}

inline void Metrics::ObserveRetryDelayMs(double) {
}

inline void Metrics::RecordEventTerminal(std::string_view) {
}

inline void Metrics::RecordStoreError(std::string_view) {
}
#endif

} // namespace outbox::observability
