#include "internal/model/event.hpp"

#include <cassert>
#include <iostream>
#include <string>

#include "internal/util/errors.hpp"
#include "internal/util/uuid.hpp"

namespace {

using outbox::model::Event;
using outbox::model::EventStatus;

bool ParseThrows(const std::string& line) {
  try {
    (void)Event::Parse(line);
  } catch (const outbox::util::ParseError&) {
    return true;
  }
  return false;
}

void TestSerializePendingEvent() {
  Event event("1", "A");
  assert(event.status == EventStatus::kPending);
  assert(event.Serialize() == "1|A|pending");
}

void TestRoundTripWithDelimitersAndNewlines() {
  Event event("order|42", "line1\nline2\r\\tail|");
  event.status = EventStatus::kProcessed;

  auto line = event.Serialize();
  assert(line.find('\n') == std::string::npos);

  auto parsed = Event::Parse(line);
  assert(parsed.id == event.id);
  assert(parsed.payload == event.payload);
  assert(parsed.status == EventStatus::kProcessed);
}

void TestFailedRecordCarriesReason() {
  Event event("7", "payload");
  event.status         = EventStatus::kFailed;
  event.failure_reason = "rejected: schema mismatch|v2";

  auto parsed = Event::Parse(event.Serialize());
  assert(parsed == event);

  auto bare = Event::Parse("8|x|failed");
  assert(bare.status == EventStatus::kFailed);
  assert(bare.failure_reason.empty());
}

void TestEmptyPayloadIsAllowed() {
  auto parsed = Event::Parse("9||pending");
  assert(parsed.id == "9");
  assert(parsed.payload.empty());
}

void TestTrailingCarriageReturnIsIgnored() {
  auto parsed = Event::Parse("3|C|processed\r");
  assert(parsed.status == EventStatus::kProcessed);
}

void TestMalformedRecordsAreRejected() {
  assert(ParseThrows(""));
  assert(ParseThrows("1|A"));
  assert(ParseThrows("1|A|pending|extra"));
  assert(ParseThrows("|A|pending"));
  assert(ParseThrows("1|A|delivered"));
  assert(ParseThrows("1|A|pending:reason"));
  assert(ParseThrows("1|A\\|pending"));
  assert(ParseThrows("1|A\\x|pending"));
  assert(ParseThrows("1|A|pend"));
}

void TestGeneratedIdsAreUuidV4() {
  auto first  = outbox::util::GenerateEventId();
  auto second = outbox::util::GenerateEventId();

  assert(first.size() == 36);
  assert(first[8] == '-' && first[13] == '-' && first[18] == '-' && first[23] == '-');
  assert(first[14] == '4');
  assert(first != second);

  // ids never need escaping in the line format
  assert(outbox::model::EscapeField(first) == first);
}

} // namespace

int main() {
  TestSerializePendingEvent();
  TestRoundTripWithDelimitersAndNewlines();
  TestFailedRecordCarriesReason();
  TestEmptyPayloadIsAllowed();
  TestTrailingCarriageReturnIsIgnored();
  TestMalformedRecordsAreRejected();
  TestGeneratedIdsAreUuidV4();

  std::cout << "outbox_relay_unit_event: pass\n";
  return 0;
}
