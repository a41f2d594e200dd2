#pragma once

#include <memory>
#include <string>
#include <string_view>

#include "internal/model/event.hpp"

namespace outbox::relay {

enum class DeliveryOutcome {
  kDelivered,
  // may succeed if repeated (network blip, broker unavailable)
  kTransient,
  // retrying cannot help (malformed payload, rejected by the target)
  kPermanent,
};

constexpr std::string_view ToString(DeliveryOutcome outcome) {
  switch (outcome) {
    case DeliveryOutcome::kDelivered:
      return "delivered";
    case DeliveryOutcome::kTransient:
      return "transient";
    case DeliveryOutcome::kPermanent:
      return "permanent";
  }
  return "unknown";
}

struct DeliveryResult {
  DeliveryOutcome outcome = DeliveryOutcome::kDelivered;
  std::string     message;

  static DeliveryResult Delivered() {
    return {};
  }

  static DeliveryResult Transient(std::string msg) {
    return {DeliveryOutcome::kTransient, std::move(msg)};
  }

  static DeliveryResult Permanent(std::string msg) {
    return {DeliveryOutcome::kPermanent, std::move(msg)};
  }

  explicit operator bool() const {
    return outcome == DeliveryOutcome::kDelivered;
  }
};

/*
  External delivery target (broker publish, HTTP call, DB write).

  Supplied by the caller at construction time. Deliver is invoked once per
  attempt and may block; the engine never calls it concurrently for the
  same event id, but different events are delivered in parallel, so
  implementations must be thread-safe.

  An exception escaping Deliver counts as a transient failure.
*/
class RelaySink {
 public:
  virtual ~RelaySink() = default;

  virtual std::string_view Name() const = 0;

  virtual DeliveryResult Deliver(const model::Event& event) = 0;
};

using RelaySinkPtr = std::shared_ptr<RelaySink>;

} // namespace outbox::relay
