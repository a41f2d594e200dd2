#include "relay_engine.hpp"

#include <algorithm>
#include <thread>

#include "config/config.pb.h"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/runtime/shutdown_coordinator.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "relay_worker.hpp"

namespace outbox::relay {

using observability::DurationField;
using observability::IntField;
using observability::StringField;

namespace {

DeliveryResult InvokeSink(RelaySink& sink, const model::Event& event) {
  try {
    return sink.Deliver(event);
  } catch (const std::exception& e) {
    return DeliveryResult::Transient(std::string("sink threw: ") + e.what());
  } catch (...) {
    return DeliveryResult::Transient("sink threw a non-standard exception");
  }
}

std::string_view TerminalName(EventOutcome outcome) {
  switch (outcome) {
    case EventOutcome::kProcessed:
      return "processed";
    case EventOutcome::kRetriesExhausted:
      return "retries_exhausted";
    default:
      return "failed";
  }
}

} // namespace

// ------------------------------------------------------------
// Options
// ------------------------------------------------------------

RelayOptions RelayOptions::FromConfig(const outbox::runtime::config::RelayConfig& config) {
  RelayOptions options;
  options.concurrency = config.concurrency() == 0 ? kDefaultConcurrency : config.concurrency();
  options.retry       = RetryPolicy::FromConfig(config.retry());
  if (config.has_store_retry()) {
    options.store_retry = RetryPolicy::FromConfig(config.store_retry());
  }
  options.deliver_timeout =
      util::FromProtoOr(config.has_deliver_timeout(), config.deliver_timeout(), std::chrono::milliseconds(0));
  options.poll_interval =
      util::FromProtoOr(config.has_poll_interval(), config.poll_interval(), std::chrono::milliseconds(1000));
  return options;
}

// ------------------------------------------------------------
// Lifecycle
// ------------------------------------------------------------

RelayEngine::RelayEngine(store::OutboxStorePtr store,
                         RelaySinkPtr sink,
                         RelayOptions options,
                         std::shared_ptr<runtime::ShutdownCoordinator> shutdown)
    : store_(std::move(store)),
      sink_(std::move(sink)),
      options_(std::move(options)),
      shutdown_(std::move(shutdown)),
      scheduler_(std::make_shared<RelayScheduler>()) {
  if (!store_) throw util::InvalidArgument("relay engine requires a store");
  if (!sink_) throw util::InvalidArgument("relay engine requires a sink");
  if (options_.concurrency == 0) throw util::InvalidArgument("relay concurrency must be at least 1");
}

RelayEngine::~RelayEngine() {
  Stop();
}

void RelayEngine::Start() {
  std::lock_guard lock(lifecycle_mutex_);
  if (stopped_) throw util::InvalidState("relay engine already stopped");
  if (started_) return;

  for (uint32_t i = 0; i < options_.concurrency; ++i) {
    auto worker = std::make_unique<RelayWorker>(scheduler_, this);
    worker->Start();
    workers_.push_back(std::move(worker));
  }
  started_ = true;

  OUTBOX_LOG_INFO("relay workers started",
                  {StringField("sink", sink_->Name()), IntField("concurrency", options_.concurrency)});
}

void RelayEngine::Stop() {
  std::lock_guard lock(lifecycle_mutex_);
  if (stopped_) return;
  stopped_ = true;

  scheduler_->Shutdown();
  for (auto& worker : workers_) {
    worker->Join();
  }
  workers_.clear();
}

// ------------------------------------------------------------
// Passes
// ------------------------------------------------------------

RelaySummary RelayEngine::RunOnce(const runtime::CancellationToken& token) {
  std::lock_guard run_lock(run_mutex_);

  RelaySummary summary;
  if (token.IsCancelled()) return summary;

  Start();

  auto scan = store_->ListPending();
  if (!scan.status) {
    observability::Metrics::Instance().RecordStoreError("list_pending");
    OUTBOX_LOG_ERROR("pending scan failed",
                     {StringField("code", store::ToString(scan.status.code)),
                      StringField("error", scan.status.message)});
    summary.store_errors = 1;
    return summary;
  }

  if (scan.skipped_records > 0) {
    OUTBOX_LOG_WARN("skipped unreadable outbox records",
                    {IntField("skipped", static_cast<int64_t>(scan.skipped_records))});
  }

  const std::size_t count = scan.events.size();
  if (count == 0) {
    summary.skipped_records = scan.skipped_records;
    return summary;
  }

  auto batch = std::make_shared<RelayBatch>(count, token);
  for (std::size_t i = 0; i < count; ++i) {
    try {
      scheduler_->Enqueue(RelayTask{std::move(scan.events[i]), batch});
    } catch (const util::InvalidState&) {
      // engine stopped underneath us: the rest stays Pending
      for (std::size_t j = i; j < count; ++j) {
        batch->Complete(EventOutcome::kNotStarted, 0);
      }
      break;
    }
  }

  summary                 = batch->Wait();
  summary.scanned         = count;
  summary.skipped_records = scan.skipped_records;

  OUTBOX_LOG_INFO("relay pass complete",
                  {IntField("scanned", static_cast<int64_t>(summary.scanned)),
                   IntField("delivered", static_cast<int64_t>(summary.delivered)),
                   IntField("failed_permanent", static_cast<int64_t>(summary.failed_permanent)),
                   IntField("retries_exhausted", static_cast<int64_t>(summary.retries_exhausted)),
                   IntField("interrupted", static_cast<int64_t>(summary.interrupted)),
                   IntField("not_started", static_cast<int64_t>(summary.not_started)),
                   IntField("store_errors", static_cast<int64_t>(summary.store_errors)),
                   IntField("attempts", static_cast<int64_t>(summary.attempts))});
  return summary;
}

void RelayEngine::Run(const runtime::CancellationToken& token) {
  OUTBOX_LOG_INFO("relay loop started",
                  {StringField("sink", sink_->Name()), DurationField("poll_interval", options_.poll_interval)});

  while (!token.IsCancelled()) {
    RunOnce(token);
    if (token.WaitFor(options_.poll_interval)) break;
  }

  OUTBOX_LOG_INFO("relay loop stopped");
}

// ------------------------------------------------------------
// Per-event state machine
// ------------------------------------------------------------

void RelayEngine::Process(RelayTask& task) {
  const auto& token    = task.batch->Token();
  uint32_t     attempts = 0;
  EventOutcome outcome  = EventOutcome::kNotStarted;

  {
    runtime::ShutdownCoordinator::InFlightGuard in_flight;
    if (shutdown_) in_flight = shutdown_->TrackInFlight();

    if (token.IsCancelled()) {
      OUTBOX_LOG_DEBUG("delivery not started, shutting down", {StringField("id", task.event.id)});
    } else {
      try {
        outcome = Relay(task.event, token, attempts);
      } catch (const std::exception& e) {
        OUTBOX_LOG_ERROR("relay task aborted, event left pending",
                         {StringField("id", task.event.id), StringField("error", e.what())});
        outcome = EventOutcome::kInterrupted;
      } catch (...) {
        OUTBOX_LOG_ERROR("relay task aborted by non-standard exception, event left pending", {StringField("id", task.event.id)});
        outcome = EventOutcome::kInterrupted;
      }
    }
  }

  task.batch->Complete(outcome, attempts);
}

EventOutcome RelayEngine::Relay(const model::Event& event, const runtime::CancellationToken& token, uint32_t& attempts) {
  observability::SpanScope span("outbox.relay.event");
  span.SetAttribute("outbox.event_id", event.id);
  span.SetAttribute("outbox.sink", sink_->Name());

  std::future<DeliveryResult> late;

  for (uint32_t attempt = 1;; ++attempt) {
    if (token.IsCancelled()) {
      return attempt == 1 ? EventOutcome::kNotStarted : EventOutcome::kInterrupted;
    }

    attempts = attempt;
    span.AddEvent("attempt");
    span.SetAttribute("outbox.attempts", static_cast<int64_t>(attempt));

    DeliveryResult result = Attempt(event, late);

    if (result) {
      OUTBOX_LOG_DEBUG("event delivered", {StringField("id", event.id), IntField("attempt", attempt)});
      return Record(event, EventOutcome::kProcessed, {});
    }

    if (result.outcome == DeliveryOutcome::kPermanent) {
      span.RecordException(result.message);
      OUTBOX_LOG_ERROR("permanent delivery failure",
                       {StringField("id", event.id), IntField("attempt", attempt),
                        StringField("error", result.message)});
      return Record(event, EventOutcome::kFailedPermanent, result.message);
    }

    if (!options_.retry.ShouldRetry(attempt)) {
      if (JoinLateDelivery(event, late)) {
        return Record(event, EventOutcome::kProcessed, {});
      }

      std::string reason =
          "retries exhausted after " + std::to_string(attempt) + " attempts: " + result.message;
      span.RecordException(reason);
      OUTBOX_LOG_ERROR("retries exhausted",
                       {StringField("id", event.id), IntField("attempts", attempt),
                        StringField("error", result.message)});
      return Record(event, EventOutcome::kRetriesExhausted, reason);
    }

    const auto delay = options_.retry.NextDelay(attempt);
    observability::Metrics::Instance().ObserveRetryDelayMs(static_cast<double>(delay.count()));
    OUTBOX_LOG_WARN("transient delivery failure, retrying",
                    {StringField("id", event.id), IntField("attempt", attempt), DurationField("backoff", delay),
                     StringField("error", result.message)});

    const bool cancelled = token.WaitFor(delay);

    if (JoinLateDelivery(event, late)) {
      return Record(event, EventOutcome::kProcessed, {});
    }

    if (cancelled) {
      OUTBOX_LOG_INFO("relay interrupted during backoff, event left pending",
                      {StringField("id", event.id), IntField("attempts", attempt)});
      return EventOutcome::kInterrupted;
    }
  }
}

DeliveryResult RelayEngine::Attempt(const model::Event& event, std::future<DeliveryResult>& late) {
  auto& metrics = observability::Metrics::Instance();
  const auto start = std::chrono::steady_clock::now();

  DeliveryResult   result;
  std::string_view outcome_label;

  if (options_.deliver_timeout.count() <= 0) {
    result        = InvokeSink(*sink_, event);
    outcome_label = ToString(result.outcome);
  } else {
    auto sink   = sink_;
    auto future = std::async(std::launch::async, [sink, event] { return InvokeSink(*sink, event); });

    if (future.wait_for(options_.deliver_timeout) == std::future_status::ready) {
      result        = future.get();
      outcome_label = ToString(result.outcome);
    } else {
      late          = std::move(future);
      result        = DeliveryResult::Transient("deliver timed out after " +
                                         std::to_string(options_.deliver_timeout.count()) + "ms");
      outcome_label = "timeout";
    }
  }

  const auto elapsed = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start);
  metrics.RecordDeliveryAttempt(sink_->Name(), outcome_label);
  metrics.ObserveDeliveryLatencyMs(sink_->Name(), elapsed.count());
  return result;
}

bool RelayEngine::JoinLateDelivery(const model::Event& event, std::future<DeliveryResult>& late) {
  if (!late.valid()) return false;

  DeliveryResult result = late.get();
  if (!result) return false;

  OUTBOX_LOG_INFO("timed out delivery completed late", {StringField("id", event.id)});
  return true;
}

EventOutcome RelayEngine::Record(const model::Event& event, EventOutcome resolved, const std::string& reason) {
  const bool processed = resolved == EventOutcome::kProcessed;

  auto result = UpdateStatus(processed ? "mark_processed" : "mark_failed", event.id, [&] {
    return processed ? store_->MarkProcessed(event.id) : store_->MarkFailed(event.id, reason);
  });

  if (!result) {
    if (processed) {
      OUTBOX_LOG_WARN("delivered event left pending, it will be delivered again",
                      {StringField("id", event.id)});
    }
    return EventOutcome::kStoreError;
  }

  observability::Metrics::Instance().RecordEventTerminal(TerminalName(resolved));
  return resolved;
}

store::Result RelayEngine::UpdateStatus(std::string_view operation,
                                        const std::string& id,
                                        const std::function<store::Result()>& update) {
  for (uint32_t attempt = 1;; ++attempt) {
    store::Result result = update();
    if (result) return result;

    observability::Metrics::Instance().RecordStoreError(operation);

    if (!result.IsRetryable()) {
      OUTBOX_LOG_ERROR("status update rejected",
                       {StringField("operation", operation), StringField("id", id),
                        StringField("code", store::ToString(result.code)), StringField("error", result.message)});
      return result;
    }

    if (!options_.store_retry.ShouldRetry(attempt)) {
      OUTBOX_LOG_ERROR("status update failed, giving up",
                       {StringField("operation", operation), StringField("id", id), IntField("attempts", attempt),
                        StringField("error", result.message)});
      return result;
    }

    // not cancellable: a lost status update means a duplicate delivery
    const auto delay = options_.store_retry.NextDelay(attempt);
    OUTBOX_LOG_WARN("status update failed, retrying",
                    {StringField("operation", operation), StringField("id", id), IntField("attempt", attempt),
                     DurationField("backoff", delay), StringField("error", result.message)});
    std::this_thread::sleep_for(delay);
  }
}

} // namespace outbox::relay
