#pragma once

#include <cstdint>
#include <string>

namespace AdaptiveGovernor
{

enum class LifecyclePhase : std::uint8_t
{
    FOREGROUND = 0,
    BACKGROUND = 1
};

enum class PressureLevel : std::uint8_t
{
    NORMAL = 0,
    ELEVATED = 1,
    CRITICAL = 2
};

struct LifecycleState
{
    LifecyclePhase phase = LifecyclePhase::FOREGROUND;
    PressureLevel pressure = PressureLevel::NORMAL;

    bool operator==(const LifecycleState &other) const
    {
        return phase == other.phase && pressure == other.pressure;
    }

    bool operator!=(const LifecycleState &other) const
    {
        return !(*this == other);
    }
};

// One reading from the resource-pressure source
struct PressureSample
{
    double memory_ratio{}; // 0.0 - 1.0
    bool battery_saver = false;
};

inline std::string phaseToString(LifecyclePhase phase)
{
    return phase == LifecyclePhase::FOREGROUND ? "Foreground" : "Background";
}

inline std::string pressureToString(PressureLevel level)
{
    switch (level)
    {
    case PressureLevel::NORMAL:
        return "Normal";
    case PressureLevel::ELEVATED:
        return "Elevated";
    case PressureLevel::CRITICAL:
        return "Critical";
    default:
        return "Unknown";
    }
}

inline std::string stateToString(const LifecycleState &state)
{
    return phaseToString(state.phase) + "/" + pressureToString(state.pressure);
}

} // namespace AdaptiveGovernor
