#pragma once

#include <chrono>
#include <cstdint>

#include "google/protobuf/timestamp.pb.h"

namespace rowsweep::util {

/*
  Time utilities — single place to control clock source later.

  Wall clock for persisted timestamps, steady clock for batch timing.
*/

using Clock       = std::chrono::system_clock;
using TimePoint   = Clock::time_point;
using SteadyClock = std::chrono::steady_clock;

TimePoint Now();

google::protobuf::Timestamp ToProto(TimePoint tp);
TimePoint                   FromProto(const google::protobuf::Timestamp& ts);

double SecondsSince(SteadyClock::time_point start);

} // namespace rowsweep::util
