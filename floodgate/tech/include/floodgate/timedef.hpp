#pragma once

#include <chrono>

namespace floodgate {

/// system_clock is the only clock convertible to Unix epoch time, it is used for everything that ends up printed
/// (Date header, access log). Durations and timeouts are measured with steady_clock.
using SysClock = std::chrono::system_clock;
using SysTimePoint = SysClock::time_point;
using SysDuration = SysClock::duration;

using SteadyClock = std::chrono::steady_clock;
using SteadyTimePoint = SteadyClock::time_point;

}  // namespace floodgate
