#include "shutdown_coordinator.hpp"

#include <csignal>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace outbox::runtime {

namespace {

volatile std::sig_atomic_t g_signal_received = 0;

constexpr std::chrono::milliseconds kSignalPollInterval{50};

void HandleTerminationSignal(int signal) {
  g_signal_received = signal;
}

std::string_view SignalName(int signal) {
  switch (signal) {
    case SIGINT:
      return "SIGINT";
    case SIGTERM:
      return "SIGTERM";
    default:
      return "signal";
  }
}

} // namespace

// ------------------------------------------------------------
// InFlightGuard
// ------------------------------------------------------------

ShutdownCoordinator::InFlightGuard::InFlightGuard(ShutdownCoordinator* owner) : owner_(owner) {
}

ShutdownCoordinator::InFlightGuard::~InFlightGuard() {
  Release();
}

ShutdownCoordinator::InFlightGuard::InFlightGuard(InFlightGuard&& other) noexcept : owner_(other.owner_) {
  other.owner_ = nullptr;
}

ShutdownCoordinator::InFlightGuard& ShutdownCoordinator::InFlightGuard::operator=(InFlightGuard&& other) noexcept {
  if (this != &other) {
    Release();
    owner_       = other.owner_;
    other.owner_ = nullptr;
  }
  return *this;
}

void ShutdownCoordinator::InFlightGuard::Release() {
  if (owner_) {
    owner_->ReleaseInFlight();
    owner_ = nullptr;
  }
}

// ------------------------------------------------------------
// ShutdownCoordinator
// ------------------------------------------------------------

ShutdownCoordinator::ShutdownCoordinator() = default;

ShutdownCoordinator::~ShutdownCoordinator() {
  {
    std::lock_guard lock(mutex_);
    stop_watcher_ = true;
  }
  watcher_cv_.notify_all();
  if (watcher_.joinable()) watcher_.join();
}

void ShutdownCoordinator::InstallSignalHandlers() {
  if (watcher_.joinable()) {
    throw util::InvalidState("signal handlers already installed");
  }

  g_signal_received = 0;
  std::signal(SIGINT, HandleTerminationSignal);
  std::signal(SIGTERM, HandleTerminationSignal);

  watcher_ = std::thread(&ShutdownCoordinator::WatchSignals, this);
}

void ShutdownCoordinator::WatchSignals() {
  std::unique_lock lock(mutex_);
  while (!stop_watcher_) {
    watcher_cv_.wait_for(lock, kSignalPollInterval);

    const int signal = g_signal_received;
    if (signal != 0) {
      g_signal_received = 0;
      lock.unlock();
      RequestShutdown(SignalName(signal));
      lock.lock();
    }
  }
}

void ShutdownCoordinator::RequestShutdown(std::string_view reason) {
  std::size_t in_flight = 0;
  {
    std::lock_guard lock(mutex_);
    if (requested_) return;
    requested_ = true;
    reason_    = std::string(reason);
    in_flight  = in_flight_;
  }

  OUTBOX_LOG_INFO("shutdown requested",
                  {observability::StringField("reason", reason),
                   observability::IntField("in_flight", static_cast<int64_t>(in_flight))});

  token_.Cancel();
  drained_cv_.notify_all();
}

bool ShutdownCoordinator::ShutdownRequested() const {
  std::lock_guard lock(mutex_);
  return requested_;
}

std::string ShutdownCoordinator::Reason() const {
  std::lock_guard lock(mutex_);
  return reason_;
}

ShutdownCoordinator::InFlightGuard ShutdownCoordinator::TrackInFlight() {
  std::lock_guard lock(mutex_);
  ++in_flight_;
  return InFlightGuard(this);
}

void ShutdownCoordinator::ReleaseInFlight() {
  {
    std::lock_guard lock(mutex_);
    if (in_flight_ > 0) --in_flight_;
  }
  drained_cv_.notify_all();
}

std::size_t ShutdownCoordinator::InFlight() const {
  std::lock_guard lock(mutex_);
  return in_flight_;
}

void ShutdownCoordinator::WaitForShutdownRequest() const {
  std::unique_lock lock(mutex_);
  drained_cv_.wait(lock, [&] { return requested_; });
}

void ShutdownCoordinator::WaitForInFlight() const {
  std::unique_lock lock(mutex_);
  drained_cv_.wait(lock, [&] { return in_flight_ == 0; });
}

bool ShutdownCoordinator::WaitForInFlight(std::chrono::milliseconds timeout) const {
  std::unique_lock lock(mutex_);
  return drained_cv_.wait_for(lock, timeout, [&] { return in_flight_ == 0; });
}

} // namespace outbox::runtime
