#pragma once

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>

namespace outbox::runtime {

/*
  Cooperative cancellation flag.

  Copies share state: cancelling any copy cancels all of them. Checked by
  the relay before each delivery attempt and while sleeping through a
  backoff, so a cancelled engine wakes immediately instead of finishing
  the delay.
*/
class CancellationToken {
 public:
  CancellationToken();

  bool IsCancelled() const;

  // idempotent
  void Cancel();

  // sleeps up to `timeout`; returns true if cancelled (before or during)
  bool WaitFor(std::chrono::milliseconds timeout) const;

  // blocks until cancelled
  void Wait() const;

 private:
  struct State {
    std::mutex              mutex;
    std::condition_variable cv;
    bool                    cancelled = false;
  };

  std::shared_ptr<State> state_;
};

} // namespace outbox::runtime
