#include "relay_task.hpp"

namespace outbox::relay {

void RelaySummary::Add(EventOutcome outcome, std::uint32_t event_attempts) {
  attempts += event_attempts;
  switch (outcome) {
    case EventOutcome::kProcessed:
      ++delivered;
      break;
    case EventOutcome::kFailedPermanent:
      ++failed_permanent;
      break;
    case EventOutcome::kRetriesExhausted:
      ++retries_exhausted;
      break;
    case EventOutcome::kInterrupted:
      ++interrupted;
      break;
    case EventOutcome::kNotStarted:
      ++not_started;
      break;
    case EventOutcome::kStoreError:
      ++store_errors;
      break;
  }
}

RelayBatch::RelayBatch(std::size_t size, runtime::CancellationToken token)
    : token_(std::move(token)), remaining_(size) {
}

void RelayBatch::Complete(EventOutcome outcome, std::uint32_t attempts) {
  bool done = false;
  {
    std::lock_guard lock(mutex_);
    summary_.Add(outcome, attempts);
    if (remaining_ > 0) --remaining_;
    done = remaining_ == 0;
  }
  if (done) cv_.notify_all();
}

RelaySummary RelayBatch::Wait() {
  std::unique_lock lock(mutex_);
  cv_.wait(lock, [&] { return remaining_ == 0; });
  return summary_;
}

} // namespace outbox::relay
