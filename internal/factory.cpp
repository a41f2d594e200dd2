#include "factory.hpp"

#include "internal/observability/logging.hpp"
#include "internal/relay/sinks/sink_factory.hpp"
#include "internal/store/store_factory.hpp"

namespace outbox::factory {

using observability::IntField;
using observability::StringField;

Application Build(const outbox::runtime::config::RuntimeConfig& config) {
  Application app;

  // ------------------------------------------------------------------
  // Store and sink
  // ------------------------------------------------------------------
  app.store = store::StoreFactory::Build(config.store());
  app.sink  = relay::sinks::SinkFactory::Build(config.sink());

  // ------------------------------------------------------------------
  // Relay
  // ------------------------------------------------------------------
  app.shutdown = std::make_shared<runtime::ShutdownCoordinator>();

  auto options = relay::RelayOptions::FromConfig(config.relay());
  OUTBOX_LOG_INFO("relay configured",
                  {StringField("sink", app.sink->Name()), IntField("concurrency", options.concurrency),
                   IntField("max_attempts", options.retry.MaxAttempts()),
                   observability::DurationField("base_delay", options.retry.BaseDelay()),
                   observability::DurationField("max_delay", options.retry.MaxDelay())});

  app.engine = std::make_unique<relay::RelayEngine>(app.store, app.sink, std::move(options), app.shutdown);

  return app;
}

} // namespace outbox::factory
