#pragma once

#include "../types/clock.hpp"
#include "../types/config.hpp"
#include <cstdint>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>

namespace AdaptiveGovernor
{

struct RateLimitWindow
{
    TimePoint window_start{};
    uint32_t count = 0;
};

// Fixed-window limiter keyed by action class. A refused call is not queued.
class RateLimiter
{
    public:
    explicit RateLimiter(const RateLimitConfig &config, TimeSource time_source = defaultTimeSource());

    // Counts the call against the class window, false once the window is full
    bool tryAcquire(const std::string &action_class);

    // Drops windows that have fully elapsed, returns how many were removed
    size_t prune();

    uint32_t limitFor(const std::string &action_class) const;
    size_t windowCount() const;

    // "feed:page=2" -> "feed"; keys without a ':' are their own class
    static std::string actionClassOf(std::string_view key);

    private:
    RateLimitConfig config;
    TimeSource now;
    Milliseconds window_size;

    mutable std::mutex windows_mutex;
    std::unordered_map<std::string, RateLimitWindow> windows;
};

} // namespace AdaptiveGovernor
