#pragma once

#include <string>

#include "config/config.pb.h"

namespace YAML {
class Node;
}

namespace outbox::config {

/*
  Loads RuntimeConfig from YAML file.

  YAML is converted to JSON then parsed into protobuf. Durations use the
  protobuf JSON form ("0.1s", "60s").

  Missing relay/retry values are filled with defaults and the result is
  validated; anything unusable throws std::runtime_error.
*/
class ConfigLoader {
 public:
  static outbox::runtime::config::RuntimeConfig LoadFromYaml(const std::string& path);

  // YAML text instead of a file
  static outbox::runtime::config::RuntimeConfig LoadFromYamlString(const std::string& yaml);

  static void ApplyDefaults(outbox::runtime::config::RuntimeConfig& config);
  static void Validate(const outbox::runtime::config::RuntimeConfig& config);

 private:
  static outbox::runtime::config::RuntimeConfig FromYaml(const YAML::Node& yaml);
};

} // namespace outbox::config
