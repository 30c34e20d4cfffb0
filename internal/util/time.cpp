#include "time.hpp"

namespace fetchgate::util {

TimePoint Now() {
  return Clock::now();
}

SteadyTimePoint SteadyNow() {
  return SteadyClock::now();
}

google::protobuf::Timestamp ToProto(TimePoint tp) {
  auto sec   = std::chrono::time_point_cast<std::chrono::seconds>(tp);
  auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(tp - sec);

  google::protobuf::Timestamp ts;
  ts.set_seconds(sec.time_since_epoch().count());
  ts.set_nanos(static_cast<int32_t>(nanos.count()));
  return ts;
}

} // namespace fetchgate::util
