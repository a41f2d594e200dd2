#include "internal/relay/retry_policy.hpp"

#include <cassert>
#include <chrono>
#include <cstdint>
#include <iostream>
#include <limits>
#include <stdexcept>

namespace {

using outbox::relay::RetryPolicy;
using std::chrono::milliseconds;

void AssertDelayInRange(const RetryPolicy& policy, uint32_t attempt, int64_t low, int64_t high) {
  for (int i = 0; i < 200; ++i) {
    auto delay = policy.NextDelay(attempt).count();
    assert(delay >= low);
    assert(delay < high);
  }
}

void TestExponentialBackoffWithJitter() {
  RetryPolicy policy(milliseconds(100), 5);

  AssertDelayInRange(policy, 1, 100, 150);
  AssertDelayInRange(policy, 2, 200, 250);
  AssertDelayInRange(policy, 3, 400, 450);

  assert(policy.BaseDelayFor(1) == milliseconds(100));
  assert(policy.BaseDelayFor(4) == milliseconds(800));
}

void TestAttemptZeroIsTreatedAsFirst() {
  RetryPolicy policy(milliseconds(100), 5);
  assert(policy.BaseDelayFor(0) == milliseconds(100));
  AssertDelayInRange(policy, 0, 100, 150);
}

void TestDelayIsClampedToMax() {
  RetryPolicy policy(milliseconds(100), 100, milliseconds(1000));

  assert(policy.BaseDelayFor(4) == milliseconds(800));
  assert(policy.BaseDelayFor(5) == milliseconds(1000));
  for (uint32_t attempt = 5; attempt < 100; ++attempt) {
    assert(policy.NextDelay(attempt) == milliseconds(1000));
  }

  // shift far beyond 64 bits must not overflow
  assert(policy.BaseDelayFor(std::numeric_limits<uint32_t>::max()) == milliseconds(1000));
}

void TestZeroBaseDelayRetriesImmediately() {
  RetryPolicy policy(milliseconds(0), 3);
  assert(policy.NextDelay(1) == milliseconds(0));
  assert(policy.NextDelay(10) == milliseconds(0));
}

void TestShouldRetryStopsAtMaxAttempts() {
  RetryPolicy policy(milliseconds(10), 3);
  assert(policy.ShouldRetry(1));
  assert(policy.ShouldRetry(2));
  assert(!policy.ShouldRetry(3));
  assert(!policy.ShouldRetry(4));

  RetryPolicy single(milliseconds(10), 1);
  assert(!single.ShouldRetry(1));
}

void TestDefaults() {
  RetryPolicy policy;
  assert(policy.BaseDelay() == milliseconds(100));
  assert(policy.MaxAttempts() == 5);
  assert(policy.MaxDelay() == milliseconds(60000));
}

void TestInvalidPoliciesAreRejected() {
  bool threw = false;
  try {
    RetryPolicy policy(milliseconds(100), 0);
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw && "max_attempts 0 must be rejected");

  threw = false;
  try {
    RetryPolicy policy(milliseconds(100), 3, milliseconds(0));
  } catch (const std::invalid_argument&) {
    threw = true;
  }
  assert(threw && "zero max_delay must be rejected");
}

} // namespace

int main() {
  TestExponentialBackoffWithJitter();
  TestAttemptZeroIsTreatedAsFirst();
  TestDelayIsClampedToMax();
  TestZeroBaseDelayRetriesImmediately();
  TestShouldRetryStopsAtMaxAttempts();
  TestDefaults();
  TestInvalidPoliciesAreRejected();

  std::cout << "outbox_relay_unit_retry_policy: pass\n";
  return 0;
}
