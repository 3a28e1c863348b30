#pragma once

#include "clock.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace AdaptiveGovernor
{

using Payload = std::vector<uint8_t>;

struct CacheEntry
{
    std::string key;
    Payload payload;

    TimePoint created_at{};
    TimePoint last_access_at{};

    // The admitting write counts as the first access
    uint64_t access_count = 1;

    // Zero means no expiry; the entry only leaves through eviction or removal
    Milliseconds ttl{ 0 };

    // Insertion order, breaks eviction ties between entries created at the same instant
    uint64_t sequence = 0;

    size_t size() const
    {
        return payload.size();
    }

    bool hasExpiry() const
    {
        return ttl.count() > 0;
    }

    bool isExpired(TimePoint now) const
    {
        return hasExpiry() && now - created_at >= ttl;
    }

    std::optional<TimePoint> deadline() const
    {
        if (!hasExpiry())
        {
            return std::nullopt;
        }
        return created_at + ttl;
    }
};

struct CacheEntrySummary
{
    std::string key;
    size_t size_bytes{};
    uint64_t access_count{};
};

struct CacheStats
{
    size_t size_bytes{};
    size_t entry_count{};
    size_t capacity{};
    size_t normal_capacity{};
    double utilization_ratio{};

    uint64_t hits{};
    uint64_t misses{};
    uint64_t evictions{};
    uint64_t expirations{};

    std::vector<CacheEntrySummary> top_entries;
};

struct JanitorReport
{
    size_t reclaimed_bytes{};
    size_t removed_entries{};
};

} // namespace AdaptiveGovernor
