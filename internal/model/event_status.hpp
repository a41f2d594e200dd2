#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace outbox::model {

enum class EventStatus : std::uint8_t {
  kPending   = 0,
  kProcessed = 1,
  kFailed    = 2,
};

constexpr bool IsTerminal(EventStatus status) {
  return status == EventStatus::kProcessed || status == EventStatus::kFailed;
}

/*
  Relay transitions are monotonic: Pending -> Processed | Failed.
  Requeue (Failed -> Pending) is an operator action and is checked separately.
*/
constexpr bool CanTransition(EventStatus from, EventStatus to) {
  if (IsTerminal(from)) {
    return false;
  }
  return to != EventStatus::kPending;
}

constexpr std::string_view ToString(EventStatus status) {
  switch (status) {
    case EventStatus::kPending:
      return "pending";
    case EventStatus::kProcessed:
      return "processed";
    case EventStatus::kFailed:
      return "failed";
  }
  return "unknown";
}

constexpr std::optional<EventStatus> ParseStatus(std::string_view token) {
  if (token == "pending") return EventStatus::kPending;
  if (token == "processed") return EventStatus::kProcessed;
  if (token == "failed") return EventStatus::kFailed;
  return std::nullopt;
}

} // namespace outbox::model
