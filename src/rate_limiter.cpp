#include "../include/adaptive-governor/rate_limiter.hpp"
#include "../include/adaptive-governor/logger.hpp"
#include "../include/adaptive-governor/metrics_collector.hpp"

namespace AdaptiveGovernor
{

RateLimiter::RateLimiter(const RateLimitConfig &config, TimeSource time_source)
: config(config), now(time_source ? std::move(time_source) : defaultTimeSource()), window_size(config.window_ms)
{
}

bool RateLimiter::tryAcquire(const std::string &action_class)
{
    const uint32_t limit = limitFor(action_class);

    std::lock_guard<std::mutex> lock(windows_mutex);
    const TimePoint current = now();

    auto [it, inserted] = windows.try_emplace(action_class, RateLimitWindow{ current, 0 });
    RateLimitWindow &window = it->second;

    if (!inserted && current - window.window_start >= window_size)
    {
        window.window_start = current;
        window.count = 0;
    }

    if (window.count >= limit)
    {
        Logger::debug(LogCategory::RATE_LIMIT, "Refusing {}: {} calls in current {} ms window", action_class,
                      window.count, config.window_ms);
        GlobalMetrics::instance().recordRateLimited(action_class);
        return false;
    }

    window.count++;
    return true;
}

size_t RateLimiter::prune()
{
    std::lock_guard<std::mutex> lock(windows_mutex);
    const TimePoint current = now();

    size_t removed = std::erase_if(windows,
                                   [&](const auto &item)
                                   {
                                       return current - item.second.window_start >= window_size;
                                   });

    if (removed > 0)
    {
        Logger::trace(LogCategory::RATE_LIMIT, "Pruned {} elapsed windows, {} remain", removed, windows.size());
    }

    return removed;
}

uint32_t RateLimiter::limitFor(const std::string &action_class) const
{
    auto it = config.classes.find(action_class);
    return it != config.classes.end() ? it->second : config.max_requests;
}

size_t RateLimiter::windowCount() const
{
    std::lock_guard<std::mutex> lock(windows_mutex);
    return windows.size();
}

std::string RateLimiter::actionClassOf(std::string_view key)
{
    auto separator = key.find(':');
    return std::string(separator == std::string_view::npos ? key : key.substr(0, separator));
}

} // namespace AdaptiveGovernor
