#pragma once

#include <chrono>
#include <functional>

namespace AdaptiveGovernor
{

using SteadyClock = std::chrono::steady_clock;
using TimePoint = SteadyClock::time_point;
using Milliseconds = std::chrono::milliseconds;

// Injectable "now" so expiry and window logic can be driven from tests
using TimeSource = std::function<TimePoint()>;

inline TimeSource defaultTimeSource()
{
    return []
    {
        return SteadyClock::now();
    };
}

} // namespace AdaptiveGovernor
