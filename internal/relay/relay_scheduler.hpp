#pragma once

#include <condition_variable>
#include <mutex>
#include <optional>
#include <queue>

#include "relay_task.hpp"

namespace outbox::relay {

/*
  Thread-safe blocking queue for relay workers.
*/
class RelayScheduler {
 public:
  void Enqueue(RelayTask task);

  // blocking wait; nullopt once shut down and drained
  std::optional<RelayTask> Dequeue();

  void Shutdown();

  bool IsShutdown() const;

 private:
  mutable std::mutex      mutex_;
  std::condition_variable cv_;
  std::queue<RelayTask>   queue_;
  bool                    shutdown_ = false;
};

} // namespace outbox::relay
