#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include "internal/runtime/cancellation.hpp"
#include "internal/store/outbox_store.hpp"
#include "relay_scheduler.hpp"
#include "relay_sink.hpp"
#include "relay_task.hpp"
#include "retry_policy.hpp"

namespace outbox::runtime {
class ShutdownCoordinator;
}

namespace outbox::runtime::config {
class RelayConfig;
}

namespace outbox::relay {

class RelayWorker;

struct RelayOptions {
  static constexpr uint32_t kDefaultConcurrency = 4;

  uint32_t    concurrency = kDefaultConcurrency;
  RetryPolicy retry;
  RetryPolicy store_retry{std::chrono::milliseconds(50), 5, std::chrono::milliseconds(5000)};
  // 0 = wait for the sink indefinitely
  std::chrono::milliseconds deliver_timeout{0};
  std::chrono::milliseconds poll_interval{1000};

  static RelayOptions FromConfig(const outbox::runtime::config::RelayConfig& config);
};

/*
  Relay engine.

  Reads Pending events from the store and drives each one through

      Pending → Delivering → Processed
                           → Retrying → Delivering ...
                           → Failed

  on a pool of `concurrency` worker threads. Attempts for one event are
  strictly sequential; different events are delivered in parallel.

  Delivery is at-least-once: the status update happens after the sink
  reports success, so a crash in between re-delivers the event on restart.

  Cancellation (token or ShutdownCoordinator) is observed before every
  attempt and during backoff. An attempt that has started is never
  abandoned; it runs to completion and its outcome is recorded.
*/
class RelayEngine {
 public:
  RelayEngine(store::OutboxStorePtr store,
              RelaySinkPtr sink,
              RelayOptions options,
              std::shared_ptr<runtime::ShutdownCoordinator> shutdown = nullptr);
  ~RelayEngine();

  RelayEngine(const RelayEngine&)            = delete;
  RelayEngine& operator=(const RelayEngine&) = delete;

  // spawns the worker pool; RunOnce starts it on demand
  void Start();
  // drains queued tasks and joins the workers; the engine cannot be restarted
  void Stop();

  /*
    One pass over the pending events. Blocks until every dispatched event
    has been resolved or skipped because of cancellation.
  */
  RelaySummary RunOnce(const runtime::CancellationToken& token);

  // RunOnce every poll_interval until cancelled
  void Run(const runtime::CancellationToken& token);

  const RelayOptions& Options() const {
    return options_;
  }

 private:
  friend class RelayWorker;

  void Process(RelayTask& task);

  EventOutcome Relay(const model::Event& event, const runtime::CancellationToken& token, uint32_t& attempts);

  DeliveryResult Attempt(const model::Event& event, std::future<DeliveryResult>& late);

  // true if a timed-out call from an earlier attempt finished with success
  bool JoinLateDelivery(const model::Event& event, std::future<DeliveryResult>& late);

  EventOutcome Record(const model::Event& event, EventOutcome resolved, const std::string& reason);

  store::Result UpdateStatus(std::string_view operation,
                             const std::string& id,
                             const std::function<store::Result()>& update);

  store::OutboxStorePtr                         store_;
  RelaySinkPtr                                  sink_;
  RelayOptions                                  options_;
  std::shared_ptr<runtime::ShutdownCoordinator> shutdown_;

  std::shared_ptr<RelayScheduler>           scheduler_;
  std::vector<std::unique_ptr<RelayWorker>> workers_;

  std::mutex lifecycle_mutex_;
  bool       started_ = false;
  bool       stopped_ = false;

  // one pass at a time
  std::mutex run_mutex_;
};

} // namespace outbox::relay
