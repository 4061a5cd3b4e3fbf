#pragma once

#include <chrono>
#include <cstdint>

namespace rtask::util {

/*
  Wall clock used for task and event timestamps.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

uint64_t ToUnixMillis(TimePoint tp);

uint64_t NowMillis();

} // namespace rtask::util
