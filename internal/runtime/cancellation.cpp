#include "cancellation.hpp"

namespace outbox::runtime {

CancellationToken::CancellationToken() : state_(std::make_shared<State>()) {
}

bool CancellationToken::IsCancelled() const {
  std::lock_guard lock(state_->mutex);
  return state_->cancelled;
}

void CancellationToken::Cancel() {
  {
    std::lock_guard lock(state_->mutex);
    state_->cancelled = true;
  }
  state_->cv.notify_all();
}

bool CancellationToken::WaitFor(std::chrono::milliseconds timeout) const {
  std::unique_lock lock(state_->mutex);
  return state_->cv.wait_for(lock, timeout, [&] { return state_->cancelled; });
}

void CancellationToken::Wait() const {
  std::unique_lock lock(state_->mutex);
  state_->cv.wait(lock, [&] { return state_->cancelled; });
}

} // namespace outbox::runtime
