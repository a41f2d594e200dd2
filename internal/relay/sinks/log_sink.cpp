#include "log_sink.hpp"

#include "internal/observability/logging.hpp"

namespace outbox::relay::sinks {

DeliveryResult LogSink::Deliver(const model::Event& event) {
  OUTBOX_LOG_INFO("event relayed",
                  {observability::StringField("id", event.id), observability::StringField("payload", event.payload)});
  return DeliveryResult::Delivered();
}

} // namespace outbox::relay::sinks
