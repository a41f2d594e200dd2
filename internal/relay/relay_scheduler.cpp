#include "relay_scheduler.hpp"

#include "internal/util/errors.hpp"

namespace outbox::relay {

void RelayScheduler::Enqueue(RelayTask task) {
  {
    std::lock_guard lock(mutex_);
    if (shutdown_) {
      throw util::InvalidState("relay scheduler is shut down");
    }
    queue_.push(std::move(task));
  }
  cv_.notify_one();
}

std::optional<RelayTask> RelayScheduler::Dequeue() {
  std::unique_lock lock(mutex_);

  cv_.wait(lock, [&] { return shutdown_ || !queue_.empty(); });

  if (shutdown_ && queue_.empty()) return std::nullopt;

  RelayTask task = std::move(queue_.front());
  queue_.pop();
  return task;
}

void RelayScheduler::Shutdown() {
  {
    std::lock_guard lock(mutex_);
    shutdown_ = true;
  }
  cv_.notify_all();
}

bool RelayScheduler::IsShutdown() const {
  std::lock_guard lock(mutex_);
  return shutdown_;
}

} // namespace outbox::relay
