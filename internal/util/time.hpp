#pragma once

#include <chrono>
#include <cstdint>

namespace asyncquery::util {

/*
  Time utilities. Single place to control the clock source.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

uint64_t ToUnixMillis(TimePoint tp);

// Convenience for record timestamps.
uint64_t NowMillis();

} // namespace asyncquery::util
