#pragma once

#include "internal/relay/relay_sink.hpp"

namespace outbox::relay::sinks {

/*
  Writes each event to the process log. Always succeeds.
*/
class LogSink final : public RelaySink {
 public:
  std::string_view Name() const override {
    return "log";
  }

  DeliveryResult Deliver(const model::Event& event) override;
};

} // namespace outbox::relay::sinks
