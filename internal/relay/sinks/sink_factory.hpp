#pragma once

#include "config/config.pb.h"
#include "internal/relay/relay_sink.hpp"

namespace outbox::relay::sinks {

/*
  Builds the configured delivery target. Defaults to the log sink.
*/
class SinkFactory {
public:
  static RelaySinkPtr Build(const outbox::runtime::config::SinkConfig& cfg);
};

} // namespace outbox::relay::sinks
