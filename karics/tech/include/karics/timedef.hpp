#pragma once

#include <chrono>

namespace karics {

// Wall clock, only used for the Date header.
using SysClock = std::chrono::system_clock;
using SysTimePoint = SysClock::time_point;
using SysDuration = SysClock::duration;

using SteadyClock = std::chrono::steady_clock;
using SteadyTimePoint = SteadyClock::time_point;

// Deadline of waits that never time out.
inline constexpr SteadyTimePoint kNoDeadline = SteadyTimePoint::max();

}  // namespace karics
