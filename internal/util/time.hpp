#pragma once

#include <chrono>

#include "google/protobuf/timestamp.pb.h"

namespace fetchgate::util {

/*
  Time utilities. Single place to control the clock source.

  Wall clock values are reported to operators; deadlines use the steady
  clock so they survive wall clock adjustments.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

using SteadyClock     = std::chrono::steady_clock;
using SteadyTimePoint = SteadyClock::time_point;

TimePoint       Now();
SteadyTimePoint SteadyNow();

google::protobuf::Timestamp ToProto(TimePoint tp);

} // namespace fetchgate::util
