#pragma once

#include <array>
#include <cstdint>
#include <string>
#include <unordered_map>

namespace AdaptiveGovernor
{

struct MetricsConfig
{
    bool enabled = false;
    std::string bind_address = "127.0.0.1";
    int port = 8080;
    std::string endpoint_path = "/metrics";
};

struct LoggingConfig
{
    std::string level = "info";
    std::string output = "console";
    std::string file = "adaptive-governor.log";
    std::string categories = "all";
};

struct CacheConfig
{
    size_t capacity_bytes = 50 * 1024 * 1024;

    // Background cleanup: drop idle or rarely read entries, then shrink
    uint32_t aggressive_idle_seconds = 60 * 60;
    uint64_t aggressive_min_access_count = 3;
    double aggressive_shrink_ratio = 0.7;
    size_t min_capacity_bytes = 20 * 1024 * 1024;

    // Capacity applied while pressure is Critical, relative to normal capacity
    double critical_capacity_ratio = 0.5;

    size_t top_entries_count = 10;
};

struct RateLimitConfig
{
    uint32_t window_ms = 1000;
    uint32_t max_requests = 10;

    // Per action class overrides of max_requests
    std::unordered_map<std::string, uint32_t> classes;
};

struct RequestConfig
{
    // Keeps the exponential backoff shift well inside int64
    static constexpr uint32_t MAX_ATTEMPTS_LIMIT = 10;

    uint32_t timeout_ms = 15000;
    uint32_t max_attempts = 2;
    uint32_t backoff_base_ms = 1000;
    size_t max_concurrent = 3;
    size_t worker_threads = 4;
    uint32_t default_cache_ttl_ms = 5 * 60 * 1000;
    RateLimitConfig rate_limit;
};

// Indexed by [phase][pressure]
using MultiplierTable = std::array<std::array<double, 3>, 2>;

struct SchedulerConfig
{
    uint32_t sample_interval_ms = 30000;
    double elevated_threshold = 0.6;
    double critical_threshold = 0.8;
    uint32_t janitor_interval_ms = 10 * 60 * 1000;
    uint32_t rate_limit_prune_interval_ms = 60 * 1000;

    MultiplierTable multipliers{ { { 1.0, 1.5, 1.5 }, { 3.0, 4.5, 4.5 } } };
};

struct PersistenceConfig
{
    bool enabled = false;
    std::string path = "governor_cache.json";
};

struct GovernorConfig
{
    CacheConfig cache;
    RequestConfig requests;
    SchedulerConfig scheduler;
    PersistenceConfig persistence;
    MetricsConfig metrics;
    LoggingConfig logging;
};

} // namespace AdaptiveGovernor
