#pragma once

#include "cache_entry.hpp"
#include <cstdint>
#include <functional>
#include <string>

namespace AdaptiveGovernor
{

enum class GovernorStatus : std::uint8_t
{
    SUCCESS = 0,
    CAPACITY_UNAVAILABLE,
    ENCODING_FAILED,
    RATE_LIMIT_EXCEEDED,
    TIMEOUT,
    WORK_FAILED,
    CACHE_WRITE_FAILED,
    SHUTTING_DOWN
};

enum class RequestPriority : std::uint8_t
{
    HIGH = 0,
    MEDIUM = 1,
    LOW = 2
};

// Work functions report failure by throwing
using WorkFn = std::function<Payload()>;

struct RequestOptions
{
    bool use_cache = true;
    Milliseconds cache_ttl{ 5 * 60 * 1000 };
    RequestPriority priority = RequestPriority::MEDIUM;
    bool retry = true;
};

struct RequestResult
{
    GovernorStatus status = GovernorStatus::SUCCESS;
    Payload value;
    std::string error_message;

    bool ok() const
    {
        return status == GovernorStatus::SUCCESS;
    }

    static RequestResult success(Payload value)
    {
        return RequestResult{ GovernorStatus::SUCCESS, std::move(value), {} };
    }

    static RequestResult failure(GovernorStatus status, std::string message)
    {
        return RequestResult{ status, {}, std::move(message) };
    }
};

inline std::string statusToString(GovernorStatus status)
{
    switch (status)
    {
    case GovernorStatus::SUCCESS:
        return "Success";
    case GovernorStatus::CAPACITY_UNAVAILABLE:
        return "CapacityUnavailable";
    case GovernorStatus::ENCODING_FAILED:
        return "EncodingFailed";
    case GovernorStatus::RATE_LIMIT_EXCEEDED:
        return "RateLimitExceeded";
    case GovernorStatus::TIMEOUT:
        return "Timeout";
    case GovernorStatus::WORK_FAILED:
        return "WorkFailed";
    case GovernorStatus::CACHE_WRITE_FAILED:
        return "CacheWriteFailed";
    case GovernorStatus::SHUTTING_DOWN:
        return "ShuttingDown";
    default:
        return "Unknown";
    }
}

inline std::string priorityToString(RequestPriority priority)
{
    switch (priority)
    {
    case RequestPriority::HIGH:
        return "high";
    case RequestPriority::MEDIUM:
        return "medium";
    case RequestPriority::LOW:
        return "low";
    default:
        return "unknown";
    }
}

} // namespace AdaptiveGovernor
