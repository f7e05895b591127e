#pragma once

#include <chrono>
#include <cstdint>
#include <functional>

#include "google/protobuf/duration.pb.h"
#include "google/protobuf/timestamp.pb.h"

namespace hacktracker::util {

/*
  Time utilities. The clock source is controlled here.

  Components that make time-based decisions (cache TTL, keep-alive timers)
  take a NowFn so tests can drive time by hand.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;
using NowFn     = std::function<TimePoint()>;

TimePoint Now();

google::protobuf::Timestamp ToProto(TimePoint tp);
TimePoint                   FromProto(const google::protobuf::Timestamp& ts);

std::chrono::seconds ToSeconds(const google::protobuf::Duration& d);

uint64_t ToUnixMillis(TimePoint tp);

} // namespace hacktracker::util
