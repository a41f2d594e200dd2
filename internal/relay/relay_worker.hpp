#pragma once

#include <memory>
#include <thread>

#include "relay_scheduler.hpp"

namespace outbox::relay {

class RelayEngine;

/*
  Background worker that drives delivery tasks.

  Runs until the scheduler is shut down and its queue is drained, so every
  task of a batch is resolved (delivered, failed or counted as not started)
  before the worker exits.
*/
class RelayWorker {
 public:
  RelayWorker(std::shared_ptr<RelayScheduler> scheduler, RelayEngine* engine);
  ~RelayWorker();

  RelayWorker(const RelayWorker&)            = delete;
  RelayWorker& operator=(const RelayWorker&) = delete;

  void Start();
  // call after RelayScheduler::Shutdown
  void Join();

 private:
  void Run();

  std::shared_ptr<RelayScheduler> scheduler_;
  RelayEngine*                    engine_;

  std::thread thread_;
};

} // namespace outbox::relay
