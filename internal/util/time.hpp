#pragma once

#include <chrono>

namespace llrp::util {

/*
  Single place to control the clock source.

  Keepalive supervision and command deadlines use the steady clock so wall
  clock adjustments never fire the watchdog.
*/

using SteadyClock = std::chrono::steady_clock;
using SteadyPoint = SteadyClock::time_point;

SteadyPoint SteadyNow();

} // namespace llrp::util
