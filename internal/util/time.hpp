#pragma once

#include <chrono>
#include <cstdint>

namespace notify::util {

/*
  Time utilities, one place to swap the clock source.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

uint64_t ToUnixMillis(TimePoint tp);

} // namespace notify::util
