#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>

#include "cancellation.hpp"

namespace outbox::runtime {

/*
  Graceful shutdown.

  A termination request (SIGINT / SIGTERM or RequestShutdown) cancels the
  shared token: no new delivery attempt is started after that point.
  Deliveries already in flight are tracked with TrackInFlight and allowed
  to finish and record their outcome; the process exits only once
  InFlight() has drained to zero.

  Signal handlers only set a sig_atomic_t flag. A watcher thread turns the
  flag into a RequestShutdown call, since the token is not
  async-signal-safe.
*/
class ShutdownCoordinator {
 public:
  /*
    Decrements the in-flight count on destruction. Move-only.
  */
  class InFlightGuard {
   public:
    InFlightGuard() = default;
    explicit InFlightGuard(ShutdownCoordinator* owner);
    ~InFlightGuard();

    InFlightGuard(const InFlightGuard&)            = delete;
    InFlightGuard& operator=(const InFlightGuard&) = delete;

    InFlightGuard(InFlightGuard&& other) noexcept;
    InFlightGuard& operator=(InFlightGuard&& other) noexcept;

    void Release();

   private:
    ShutdownCoordinator* owner_ = nullptr;
  };

  ShutdownCoordinator();
  ~ShutdownCoordinator();

  ShutdownCoordinator(const ShutdownCoordinator&)            = delete;
  ShutdownCoordinator& operator=(const ShutdownCoordinator&) = delete;

  // SIGINT and SIGTERM; one coordinator per process
  void InstallSignalHandlers();

  // first call wins; later calls are ignored
  void RequestShutdown(std::string_view reason);

  bool ShutdownRequested() const;
  std::string Reason() const;

  CancellationToken Token() const {
    return token_;
  }

  InFlightGuard TrackInFlight();
  std::size_t InFlight() const;

  void WaitForShutdownRequest() const;
  void WaitForInFlight() const;
  // false if work was still in flight when the timeout expired
  bool WaitForInFlight(std::chrono::milliseconds timeout) const;

 private:
  void ReleaseInFlight();
  void WatchSignals();

  CancellationToken token_;

  mutable std::mutex              mutex_;
  mutable std::condition_variable drained_cv_;
  std::condition_variable         watcher_cv_;
  std::size_t                     in_flight_ = 0;
  bool                            requested_ = false;
  std::string                     reason_;

  std::thread watcher_;
  bool        stop_watcher_ = false;
};

} // namespace outbox::runtime
