#include "internal/config/config_loader.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>

#include "config/config.pb.h"
#include "internal/relay/relay_engine.hpp"

namespace {

using outbox::config::ConfigLoader;

std::filesystem::path WriteYaml(const std::string& test_name, const std::string& yaml_content) {
  const auto base_dir = std::filesystem::temp_directory_path() / "outbox_relay_config_loader_tests";
  std::filesystem::create_directories(base_dir);

  const auto    file_path = base_dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

bool LoadThrows(const std::string& yaml) {
  try {
    (void)ConfigLoader::LoadFromYamlString(yaml);
  } catch (const std::runtime_error&) {
    return true;
  }
  return false;
}

void TestFullConfigIsLoaded() {
  const auto yaml_path = WriteYaml("full",
                                   R"(logging:
  level: debug
store:
  file:
    path: "/var/lib/outbox/outbox.log"
    fsync: false
sink:
  file:
    path: "/var/lib/outbox/delivered.log"
    reject_empty_payload: true
relay:
  concurrency: 8
  poll_interval: "0.25s"
  deliver_timeout: "2s"
  retry:
    base_delay: "0.2s"
    max_attempts: 7
    max_delay: "30s"
observability:
  tracing_enabled: false
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.logging().level() == "debug");
  assert(config.store().has_file());
  assert(config.store().file().path() == "/var/lib/outbox/outbox.log");
  assert(config.store().file().has_fsync());
  assert(!config.store().file().fsync());
  assert(config.sink().has_file());
  assert(config.sink().file().reject_empty_payload());

  auto options = outbox::relay::RelayOptions::FromConfig(config.relay());
  assert(options.concurrency == 8);
  assert(options.poll_interval == std::chrono::milliseconds(250));
  assert(options.deliver_timeout == std::chrono::milliseconds(2000));
  assert(options.retry.BaseDelay() == std::chrono::milliseconds(200));
  assert(options.retry.MaxAttempts() == 7);
  assert(options.retry.MaxDelay() == std::chrono::milliseconds(30000));
  assert(options.store_retry.MaxAttempts() == 5);
}

void TestDefaultsAreApplied() {
  auto config = ConfigLoader::LoadFromYamlString("");

  assert(config.store().has_file());
  assert(config.store().file().path() == "outbox.log");
  assert(config.store().file().fsync());
  assert(config.sink().has_log());

  auto options = outbox::relay::RelayOptions::FromConfig(config.relay());
  assert(options.concurrency == 4);
  assert(options.poll_interval == std::chrono::milliseconds(1000));
  assert(options.deliver_timeout == std::chrono::milliseconds(0));
  assert(options.retry.BaseDelay() == std::chrono::milliseconds(100));
  assert(options.retry.MaxAttempts() == 5);
  assert(options.retry.MaxDelay() == std::chrono::milliseconds(60000));
}

void TestEmptySectionsSelectBackends() {
  auto config = ConfigLoader::LoadFromYamlString(R"(store:
  memory: {}
sink:
  log: {}
)");
  assert(config.store().has_memory());
  assert(config.sink().has_log());
}

void TestScalarEscapingForQuotedAndBackslashValues() {
  const auto yaml_path = WriteYaml("quoted_backslash",
                                   R"(store:
  sqlite:
    path: "C:\\outbox\\\"quoted\"\\db.sqlite"
)");

  auto config = ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.store().sqlite().path() == "C:\\outbox\\\"quoted\"\\db.sqlite");
}

void TestQuotedNumbersStayStrings() {
  auto config = ConfigLoader::LoadFromYamlString(R"(store:
  file:
    path: "007"
)");
  assert(config.store().file().path() == "007");
}

void TestUnknownFieldsAreRejected() {
  assert(LoadThrows(R"(relay:
  concurrency: 2
unknown_field: 123
)"));

  assert(LoadThrows(R"(relay:
  retry:
    jitter: 0.5
)"));
}

void TestInvalidValuesAreRejected() {
  assert(LoadThrows(R"(relay:
  poll_interval: "-1s"
)"));
  assert(LoadThrows(R"(relay:
  deliver_timeout: "-0.5s"
)"));
  assert(LoadThrows(R"(relay:
  retry:
    base_delay: "-0.1s"
)"));
  assert(LoadThrows(R"(sink:
  file:
    reject_empty_payload: true
)"));
  assert(LoadThrows("- just\n- a list\n"));

  outbox::runtime::config::RuntimeConfig config;
  ConfigLoader::ApplyDefaults(config);
  config.mutable_relay()->mutable_retry()->set_max_attempts(0);

  bool threw = false;
  try {
    ConfigLoader::Validate(config);
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw && "max_attempts 0 must be rejected");
}

void TestMissingFileIsReported() {
  bool threw = false;
  try {
    (void)ConfigLoader::LoadFromYaml("/nonexistent/outbox-relay.yaml");
  } catch (const std::runtime_error&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestFullConfigIsLoaded();
  TestDefaultsAreApplied();
  TestEmptySectionsSelectBackends();
  TestScalarEscapingForQuotedAndBackslashValues();
  TestQuotedNumbersStayStrings();
  TestUnknownFieldsAreRejected();
  TestInvalidValuesAreRejected();
  TestMissingFileIsReported();

  std::cout << "outbox_relay_unit_config_loader: pass\n";
  return 0;
}
