#pragma once

#include <chrono>
#include <cstdint>

namespace archive::util {

/*
  Wall clock helpers. HeightSource reads time only through these.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

uint64_t ToUnixMillis(TimePoint tp);

} // namespace archive::util
