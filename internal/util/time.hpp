#pragma once

#include <chrono>
#include <cstdint>

#include "google/protobuf/duration.pb.h"

namespace outbox::util {

/*
  Time utilities. Single place to control the clock source.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

uint64_t ToUnixMillis(TimePoint tp);

// protobuf Duration -> milliseconds; unset durations take the fallback
std::chrono::milliseconds FromProto(const google::protobuf::Duration& d);
std::chrono::milliseconds FromProtoOr(bool has_value, const google::protobuf::Duration& d, std::chrono::milliseconds fallback);

} // namespace outbox::util
