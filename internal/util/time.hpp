#pragma once

#include <chrono>
#include <cstdint>

namespace taskengine::util {

/*
  Time utilities: the single place that picks the clock source.

  Persisted timestamps are unix milliseconds.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();
uint64_t  NowMillis();

uint64_t  ToUnixMillis(TimePoint tp);

// now_ms - age_ms, clamped at zero.
uint64_t CutoffMillis(uint64_t now_ms, uint64_t age_ms);

} // namespace taskengine::util
