#include "time.hpp"

namespace localdeck::util {

TimePoint Now() {
  return Clock::now();
}

uint64_t NowMillis() {
  return ToUnixMillis(Now());
}

google::protobuf::Timestamp ToProto(TimePoint tp) {
  auto sec   = std::chrono::time_point_cast<std::chrono::seconds>(tp);
  auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(tp - sec);

  google::protobuf::Timestamp ts;
  ts.set_seconds(sec.time_since_epoch().count());
  ts.set_nanos(static_cast<int32_t>(nanos.count()));
  return ts;
}

google::protobuf::Timestamp MillisToProto(uint64_t unix_ms) {
  return ToProto(TimePoint{} + std::chrono::milliseconds(unix_ms));
}

uint64_t ToUnixMillis(TimePoint tp) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

std::chrono::milliseconds ToMillis(const google::protobuf::Duration& d, std::chrono::milliseconds fallback) {
  if (d.seconds() == 0 && d.nanos() == 0) {
    return fallback;
  }
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::seconds(d.seconds()) + std::chrono::nanoseconds(d.nanos()));
}

} // namespace localdeck::util
