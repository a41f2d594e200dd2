#include "relay_worker.hpp"

#include "relay_engine.hpp"

namespace outbox::relay {

RelayWorker::RelayWorker(std::shared_ptr<RelayScheduler> scheduler, RelayEngine* engine)
    : scheduler_(std::move(scheduler)), engine_(engine) {
}

RelayWorker::~RelayWorker() {
  scheduler_->Shutdown();
  Join();
}

void RelayWorker::Start() {
  thread_ = std::thread(&RelayWorker::Run, this);
}

void RelayWorker::Join() {
  if (thread_.joinable()) thread_.join();
}

void RelayWorker::Run() {
  while (auto task = scheduler_->Dequeue()) {
    engine_->Process(*task);
  }
}

} // namespace outbox::relay
