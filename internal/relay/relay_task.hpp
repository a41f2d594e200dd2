#pragma once

#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>

#include "internal/model/event.hpp"
#include "internal/runtime/cancellation.hpp"

namespace outbox::relay {

enum class EventOutcome {
  kProcessed,
  kFailedPermanent,
  kRetriesExhausted,
  // cancelled between attempts, left Pending
  kInterrupted,
  // dequeued after cancellation, never attempted
  kNotStarted,
  // delivery resolved but the status update could not be recorded
  kStoreError,
};

/*
  Counters for one pass over the pending events.
*/
struct RelaySummary {
  std::uint64_t scanned           = 0;
  std::uint64_t delivered         = 0;
  std::uint64_t failed_permanent  = 0;
  std::uint64_t retries_exhausted = 0;
  std::uint64_t interrupted       = 0;
  std::uint64_t not_started       = 0;
  std::uint64_t store_errors      = 0;
  std::uint64_t skipped_records   = 0;
  std::uint64_t attempts          = 0;

  void Add(EventOutcome outcome, std::uint32_t event_attempts);
};

/*
  Completion latch for one RunOnce batch.
*/
class RelayBatch {
 public:
  RelayBatch(std::size_t size, runtime::CancellationToken token);

  const runtime::CancellationToken& Token() const {
    return token_;
  }

  void Complete(EventOutcome outcome, std::uint32_t attempts);

  // blocks until every task of the batch has completed
  RelaySummary Wait();

 private:
  runtime::CancellationToken token_;

  std::mutex              mutex_;
  std::condition_variable cv_;
  std::size_t             remaining_;
  RelaySummary            summary_;
};

/*
  One pending event scheduled for delivery.
*/
struct RelayTask {
  model::Event                event;
  std::shared_ptr<RelayBatch> batch;
};

} // namespace outbox::relay
