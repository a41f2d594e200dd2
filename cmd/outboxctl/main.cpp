#include <cstdint>
#include <iostream>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/model/event.hpp"
#include "internal/observability/logging.hpp"
#include "internal/store/result.hpp"
#include "internal/util/uuid.hpp"

using namespace outbox;

static void Usage() {
  std::cout << "Usage:\n"
            << "  outboxctl <config.yaml> append <payload> [id]\n"
            << "  outboxctl <config.yaml> pending\n"
            << "  outboxctl <config.yaml> failed\n"
            << "  outboxctl <config.yaml> show <id>\n"
            << "  outboxctl <config.yaml> requeue <id>\n"
            << "  outboxctl <config.yaml> compact\n"
            << "  outboxctl <config.yaml> stats\n"
            << "  outboxctl <config.yaml> relay-once\n";
}

static int Report(const store::Result& result, const std::string& ok_message) {
  if (!result) {
    std::cerr << store::ToString(result.code) << ": " << result.message << "\n";
    return 2;
  }
  std::cout << ok_message << "\n";
  return 0;
}

static int Run(const runtime::config::RuntimeConfig& config, const std::string& cmd, int argc, char** argv) {
  auto app = factory::Build(config);

  // ------------------------------------------------------------

  if (cmd == "append") {
    if (argc < 4) {
      Usage();
      return 1;
    }

    model::Event event(argc >= 5 ? std::string(argv[4]) : util::GenerateEventId(), argv[3]);
    return Report(app.store->Append(event), "appended id=" + event.id);
  }

  // ------------------------------------------------------------

  if (cmd == "pending") {
    auto scan = app.store->ListPending();
    if (!scan.status) {
      std::cerr << store::ToString(scan.status.code) << ": " << scan.status.message << "\n";
      return 2;
    }
    for (const auto& event : scan.events) {
      std::cout << event.Serialize() << "\n";
    }
    if (scan.skipped_records > 0) {
      std::cerr << "skipped " << scan.skipped_records << " unreadable records\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "failed") {
    for (const auto& event : app.store->ListFailed()) {
      std::cout << event.Serialize() << "\n";
    }
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "show") {
    if (argc < 4) {
      Usage();
      return 1;
    }

    auto event = app.store->Get(argv[3]);
    if (!event) {
      std::cerr << "not found: " << argv[3] << "\n";
      return 2;
    }
    std::cout << event->Serialize() << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "requeue") {
    if (argc < 4) {
      Usage();
      return 1;
    }

    return Report(app.store->Requeue(argv[3]), "requeued");
  }

  // ------------------------------------------------------------

  if (cmd == "compact") {
    return Report(app.store->Compact(), "compacted");
  }

  // ------------------------------------------------------------

  if (cmd == "stats") {
    auto stats = app.store->Stats();
    std::cout << "pending=" << stats.pending << " processed=" << stats.processed << " failed=" << stats.failed
              << " skipped_records=" << stats.skipped_records << "\n";
    return 0;
  }

  // ------------------------------------------------------------

  if (cmd == "relay-once") {
    app.shutdown->InstallSignalHandlers();

    auto summary = app.engine->RunOnce(app.shutdown->Token());
    app.engine->Stop();
    app.shutdown->WaitForInFlight();

    std::cout << "scanned=" << summary.scanned << " delivered=" << summary.delivered
              << " failed_permanent=" << summary.failed_permanent
              << " retries_exhausted=" << summary.retries_exhausted << " interrupted=" << summary.interrupted
              << " not_started=" << summary.not_started << " store_errors=" << summary.store_errors
              << " skipped_records=" << summary.skipped_records << " attempts=" << summary.attempts << "\n";
    return summary.store_errors == 0 ? 0 : 2;
  }

  Usage();
  return 1;
}

int main(int argc, char** argv) {
  if (argc < 3) {
    Usage();
    return 1;
  }

  std::string config_path = argv[1];
  std::string cmd         = argv[2];

  try {
    auto config = config::ConfigLoader::LoadFromYaml(config_path);
    observability::InitializeLogging("warn");

    int rc = Run(config, cmd, argc, argv);
    observability::ShutdownLogging();
    return rc;
  } catch (const std::exception& e) {
    std::cerr << "error: " << e.what() << "\n";
    return 2;
  }
}
