#include "retry_policy.hpp"

#include <algorithm>
#include <random>

#include "config/config.pb.h"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"

namespace outbox::relay {

namespace {

int64_t Jitter(int64_t bound_ms) {
  if (bound_ms <= 0) return 0;

  static thread_local std::mt19937_64 rng{std::random_device{}()};
  std::uniform_int_distribution<int64_t> dist(0, bound_ms - 1);
  return dist(rng);
}

} // namespace

RetryPolicy::RetryPolicy() : RetryPolicy(kDefaultBaseDelay, kDefaultMaxAttempts, kDefaultMaxDelay) {
}

RetryPolicy::RetryPolicy(Duration base_delay, uint32_t max_attempts, Duration max_delay)
    : base_delay_(base_delay), max_attempts_(max_attempts), max_delay_(max_delay) {
  if (max_attempts_ == 0) {
    throw util::InvalidArgument("retry max_attempts must be at least 1");
  }
  if (base_delay_.count() < 0) {
    throw util::InvalidArgument("retry base_delay must not be negative");
  }
  if (max_delay_.count() <= 0) {
    throw util::InvalidArgument("retry max_delay must be positive");
  }
}

RetryPolicy RetryPolicy::FromConfig(const outbox::runtime::config::RetryConfig& config) {
  return RetryPolicy(util::FromProtoOr(config.has_base_delay(), config.base_delay(), kDefaultBaseDelay),
                     config.max_attempts() == 0 ? kDefaultMaxAttempts : config.max_attempts(),
                     util::FromProtoOr(config.has_max_delay(), config.max_delay(), kDefaultMaxDelay));
}

RetryPolicy::Duration RetryPolicy::BaseDelayFor(uint32_t attempt) const {
  const int64_t  base  = base_delay_.count();
  const int64_t  cap   = max_delay_.count();
  const uint32_t shift = attempt <= 1 ? 0 : attempt - 1;

  if (base == 0) return Duration{0};

  // base << shift would pass the cap (or overflow): clamp
  if (shift >= 62 || base > (cap >> shift)) return max_delay_;

  return Duration{std::min(base << shift, cap)};
}

RetryPolicy::Duration RetryPolicy::NextDelay(uint32_t attempt) const {
  const int64_t floor = BaseDelayFor(attempt).count();
  const int64_t total = floor + Jitter(base_delay_.count() / 2);
  return Duration{std::min(total, max_delay_.count())};
}

} // namespace outbox::relay
