#pragma once

#include <chrono>
#include <cstdint>

#include "google/protobuf/duration.pb.h"
#include "google/protobuf/timestamp.pb.h"

namespace localdeck::util {

/*
  Wall-clock helpers and protobuf time conversions.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

uint64_t NowMillis();

google::protobuf::Timestamp ToProto(TimePoint tp);
google::protobuf::Timestamp MillisToProto(uint64_t unix_ms);

uint64_t ToUnixMillis(TimePoint tp);

// Zero/unset durations yield `fallback`.
std::chrono::milliseconds ToMillis(const google::protobuf::Duration& d, std::chrono::milliseconds fallback);

} // namespace localdeck::util
