#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/relay/relay_engine.hpp"
#include "internal/relay/relay_sink.hpp"
#include "internal/runtime/shutdown_coordinator.hpp"
#include "internal/store/outbox_store.hpp"

namespace outbox::factory {

/*
  Application

  Owns the long-lived objects of the relay process.
*/
struct Application {
  store::OutboxStorePtr                         store;
  relay::RelaySinkPtr                           sink;
  std::shared_ptr<runtime::ShutdownCoordinator> shutdown;
  std::unique_ptr<relay::RelayEngine>           engine;
};

/*
  Build

  Composition root. The only place that knows the concrete store and sink
  types. Throws when a backend cannot be opened.
*/
Application Build(const outbox::runtime::config::RuntimeConfig& config);

} // namespace outbox::factory
