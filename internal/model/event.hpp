#pragma once

#include <string>
#include <string_view>

#include "internal/model/event_status.hpp"

namespace outbox::model {

/*
  One unit of work to relay.

  id and payload are fixed at creation; status (and failure_reason once
  Failed) is only changed by the outbox store on behalf of the relay engine.

  Persisted line format:

      id|payload|status

  with '\', '|', LF and CR escaped inside fields. A failed record may carry
  its reason as "failed:<reason>".
*/
struct Event {
  std::string id;
  std::string payload;
  EventStatus status = EventStatus::kPending;
  std::string failure_reason;

  Event() = default;
  Event(std::string event_id, std::string event_payload);

  // line format without the trailing newline
  std::string Serialize() const;

  // throws util::ParseError on malformed records
  static Event Parse(std::string_view line);
};

bool operator==(const Event& lhs, const Event& rhs);

// field escaping used by the line format
std::string EscapeField(std::string_view raw);
std::string UnescapeField(std::string_view escaped);

} // namespace outbox::model
