#pragma once

#include <chrono>
#include <cstdint>
#include <functional>

#include "google/protobuf/duration.pb.h"
#include "google/protobuf/timestamp.pb.h"

namespace settlement::util {

/*
  Clock and time conversions.

  Components that read the clock take a NowFn so tests can pin "now".
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;
using NowFn     = std::function<TimePoint()>;

TimePoint Now();

google::protobuf::Timestamp ToProto(TimePoint tp);
TimePoint                   FromProto(const google::protobuf::Timestamp& ts);

int64_t   ToUnixMillis(TimePoint tp);
TimePoint FromUnixMillis(int64_t ms);

// Unset or non-positive durations resolve to fallback.
std::chrono::milliseconds ToMillis(const google::protobuf::Duration& d, std::chrono::milliseconds fallback);

} // namespace settlement::util
