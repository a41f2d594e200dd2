#pragma once

#include <chrono>
#include <cstdint>

namespace outbox::runtime::config {
class RetryConfig;
}

namespace outbox::relay {

/*
  Exponential backoff with jitter.

      delay(n) = min(base * 2^(n-1) + jitter, max_delay)
      jitter   ∈ [0, base/2)

  Attempts are counted from 1. Immutable; safe to share between threads.
*/
class RetryPolicy {
 public:
  using Duration = std::chrono::milliseconds;

  static constexpr Duration kDefaultBaseDelay{100};
  static constexpr Duration kDefaultMaxDelay{60000};
  static constexpr uint32_t kDefaultMaxAttempts = 5;

  RetryPolicy();
  // throws util::InvalidArgument for max_attempts == 0 or negative / zero max_delay
  RetryPolicy(Duration base_delay, uint32_t max_attempts, Duration max_delay = kDefaultMaxDelay);

  static RetryPolicy FromConfig(const outbox::runtime::config::RetryConfig& config);

  // backoff to wait after failed attempt `attempt`, jitter included
  Duration NextDelay(uint32_t attempt) const;

  // deterministic part of NextDelay (no jitter), capped at max_delay
  Duration BaseDelayFor(uint32_t attempt) const;

  bool ShouldRetry(uint32_t attempt) const {
    return attempt < max_attempts_;
  }

  Duration BaseDelay() const {
    return base_delay_;
  }

  Duration MaxDelay() const {
    return max_delay_;
  }

  uint32_t MaxAttempts() const {
    return max_attempts_;
  }

 private:
  Duration base_delay_;
  uint32_t max_attempts_;
  Duration max_delay_;
};

} // namespace outbox::relay
