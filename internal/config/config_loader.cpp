#include "config_loader.hpp"

#include <google/protobuf/duration.pb.h>
#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

namespace outbox::config {

using outbox::runtime::config::RetryConfig;
using outbox::runtime::config::RuntimeConfig;

namespace {

constexpr uint32_t kDefaultConcurrency       = 4;
constexpr int64_t  kDefaultPollIntervalMs    = 1000;
constexpr uint32_t kDefaultMaxAttempts       = 5;
constexpr int64_t  kDefaultBaseDelayMs       = 100;
constexpr int64_t  kDefaultMaxDelayMs        = 60000;
constexpr uint32_t kDefaultStoreMaxAttempts  = 5;
constexpr int64_t  kDefaultStoreBaseDelayMs  = 50;
constexpr int64_t  kDefaultStoreMaxDelayMs   = 5000;

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars stay strings ("0.1s", "007")
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

  // detect numeric / bool
  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  char*        endptr        = nullptr;
  const double numeric_value = strtod(scalar_value.c_str(), &endptr);
  if (!scalar_value.empty() && endptr && *endptr == '\0') {
    value->set_number_value(numeric_value);
    return;
  }

  value->set_string_value(scalar_value);
}

void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
    case YAML::NodeType::Undefined:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (size_t i = 0; i < node.size(); ++i) {
        YamlToProtoValue(node[i], list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* struct_value = value->mutable_struct_value();
      for (auto it : node) {
        YamlToProtoValue(it.second, &(*struct_value->mutable_fields())[it.first.Scalar()]);
      }
      break;
    }
  }
}

void SetMillis(google::protobuf::Duration* d, int64_t ms) {
  d->set_seconds(ms / 1000);
  d->set_nanos(static_cast<int32_t>((ms % 1000) * 1000000));
}

bool IsNegative(const google::protobuf::Duration& d) {
  return d.seconds() < 0 || d.nanos() < 0;
}

bool IsZero(const google::protobuf::Duration& d) {
  return d.seconds() == 0 && d.nanos() == 0;
}

void DefaultRetry(RetryConfig* retry, uint32_t max_attempts, int64_t base_ms, int64_t max_ms) {
  if (retry->max_attempts() == 0) retry->set_max_attempts(max_attempts);
  if (!retry->has_base_delay()) SetMillis(retry->mutable_base_delay(), base_ms);
  if (!retry->has_max_delay()) SetMillis(retry->mutable_max_delay(), max_ms);
}

void ValidateRetry(const RetryConfig& retry, const std::string& section) {
  if (retry.max_attempts() == 0) {
    throw std::runtime_error("Invalid configuration: " + section + ".max_attempts must be at least 1");
  }
  if (IsNegative(retry.base_delay()) || IsNegative(retry.max_delay())) {
    throw std::runtime_error("Invalid configuration: " + section + " delays must not be negative");
  }
  if (IsZero(retry.max_delay())) {
    throw std::runtime_error("Invalid configuration: " + section + ".max_delay must be positive");
  }
}

} // namespace

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to load YAML config: " + std::string(e.what()));
  }

  return FromYaml(yaml);
}

RuntimeConfig ConfigLoader::LoadFromYamlString(const std::string& text) {
  YAML::Node yaml;
  try {
    yaml = YAML::Load(text);
  } catch (const std::exception& e) {
    throw std::runtime_error("Failed to parse YAML config: " + std::string(e.what()));
  }

  return FromYaml(yaml);
}

RuntimeConfig ConfigLoader::FromYaml(const YAML::Node& yaml) {
  RuntimeConfig config;

  // an empty document is a valid all-defaults config
  if (yaml.IsMap()) {
    google::protobuf::Value json_value;
    YamlToProtoValue(yaml, &json_value);

    std::string json;
    auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
    if (!to_json_status.ok()) {
      throw std::runtime_error("Failed to serialize YAML to JSON: " + std::string(to_json_status.message()));
    }

    google::protobuf::util::JsonParseOptions options;
    options.ignore_unknown_fields = false;

    auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

    if (!status.ok()) {
      throw std::runtime_error("Invalid configuration: " + std::string(status.message()));
    }
  } else if (!yaml.IsNull()) {
    throw std::runtime_error("Invalid configuration: top level must be a mapping");
  }

  ApplyDefaults(config);
  Validate(config);
  return config;
}

void ConfigLoader::ApplyDefaults(RuntimeConfig& config) {
  auto* relay = config.mutable_relay();
  if (relay->concurrency() == 0) relay->set_concurrency(kDefaultConcurrency);
  if (!relay->has_poll_interval()) SetMillis(relay->mutable_poll_interval(), kDefaultPollIntervalMs);

  DefaultRetry(relay->mutable_retry(), kDefaultMaxAttempts, kDefaultBaseDelayMs, kDefaultMaxDelayMs);
  DefaultRetry(relay->mutable_store_retry(), kDefaultStoreMaxAttempts, kDefaultStoreBaseDelayMs, kDefaultStoreMaxDelayMs);

  if (config.store().backend_case() == outbox::runtime::config::StoreConfig::BACKEND_NOT_SET) {
    auto* file = config.mutable_store()->mutable_file();
    file->set_path("outbox.log");
    file->set_fsync(true);
  }
  if (config.sink().target_case() == outbox::runtime::config::SinkConfig::TARGET_NOT_SET) {
    config.mutable_sink()->mutable_log();
  }
}

void ConfigLoader::Validate(const RuntimeConfig& config) {
  const auto& relay = config.relay();
  if (relay.concurrency() == 0) {
    throw std::runtime_error("Invalid configuration: relay.concurrency must be at least 1");
  }
  if (IsNegative(relay.poll_interval()) || IsZero(relay.poll_interval())) {
    throw std::runtime_error("Invalid configuration: relay.poll_interval must be positive");
  }
  if (IsNegative(relay.deliver_timeout())) {
    throw std::runtime_error("Invalid configuration: relay.deliver_timeout must not be negative");
  }
  ValidateRetry(relay.retry(), "relay.retry");
  ValidateRetry(relay.store_retry(), "relay.store_retry");

  if (config.store().has_file() && config.store().file().path().empty()) {
    throw std::runtime_error("Invalid configuration: store.file.path must be set");
  }
  if (config.store().has_sqlite() && config.store().sqlite().path().empty()) {
    throw std::runtime_error("Invalid configuration: store.sqlite.path must be set");
  }
  if (config.sink().has_file() && config.sink().file().path().empty()) {
    throw std::runtime_error("Invalid configuration: sink.file.path must be set");
  }
}

} // namespace outbox::config
