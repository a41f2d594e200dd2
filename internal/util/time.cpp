#include "time.hpp"

namespace outbox::util {

TimePoint Now() {
  return Clock::now();
}

uint64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

std::chrono::milliseconds FromProto(const google::protobuf::Duration& d) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::seconds(d.seconds()) + std::chrono::nanoseconds(d.nanos()));
}

std::chrono::milliseconds FromProtoOr(bool has_value, const google::protobuf::Duration& d, std::chrono::milliseconds fallback) {
  if (!has_value) return fallback;
  return FromProto(d);
}

} // namespace outbox::util
