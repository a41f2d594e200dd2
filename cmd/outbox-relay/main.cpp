#include <iostream>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"

using outbox::observability::IntField;
using outbox::observability::StringField;

namespace {

void ShutdownObservability() {
  outbox::observability::ShutdownLogging();
  outbox::observability::ShutdownMetrics();
  outbox::observability::ShutdownTracing();
}

} // namespace

int main(int argc, char** argv) {
  std::string config_path;
  if (argc == 2) {
    config_path = argv[1];
  } else if (argc == 3 && std::string(argv[1]) == "--config") {
    config_path = argv[2];
  } else {
    std::cerr << "Usage: outbox-relay <config.yaml> OR outbox-relay --config <config.yaml>" << std::endl;
    return 1;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = outbox::config::ConfigLoader::LoadFromYaml(config_path);

    outbox::observability::InitializeTracing(config);
    outbox::observability::InitializeMetrics(config);
    outbox::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build application (dependency graph)
    // ------------------------------------------------------------
    auto app = outbox::factory::Build(config);

    // Register signal handlers before the first pass so no delivery can
    // start without being tracked.
    app.shutdown->InstallSignalHandlers();

    OUTBOX_LOG_INFO("outbox relay started", {StringField("version", OUTBOX_VERSION), StringField("config", config_path)});

    // ------------------------------------------------------------
    // Relay until SIGINT / SIGTERM
    // ------------------------------------------------------------
    app.engine->Run(app.shutdown->Token());

    app.engine->Stop();
    app.shutdown->WaitForInFlight();

    OUTBOX_LOG_INFO("outbox relay stopped",
                    {StringField("reason", app.shutdown->Reason()),
                     IntField("in_flight", static_cast<int64_t>(app.shutdown->InFlight()))});

    ShutdownObservability();
  } catch (const std::exception& e) {
    OUTBOX_LOG_ERROR("fatal error", {StringField("error", e.what())});
    ShutdownObservability();
    return 2;
  }

  return 0;
}
