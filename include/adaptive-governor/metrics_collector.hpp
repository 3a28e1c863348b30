#pragma once

#include "../types/config.hpp"
#include <memory>
#include <string>
#include <string_view>

#ifdef GOVERNOR_HAVE_PROMETHEUS

#include "prometheus_metrics_impl.hpp"

namespace AdaptiveGovernor
{

class MetricsCollector
{
    public:
    explicit MetricsCollector(const MetricsConfig &config);
    ~MetricsCollector();

    MetricsCollector(const MetricsCollector &) = delete;
    MetricsCollector &operator=(const MetricsCollector &) = delete;

    // Cache metrics
    void recordCacheHit();
    void recordCacheMiss();
    void updateCacheSize(size_t bytes);
    void updateCacheEntryCount(size_t count);
    void updateCacheCapacity(size_t bytes);
    void recordCacheEviction(std::string_view reason = "capacity");
    void recordCacheExpiration(size_t count = 1);
    void recordCacheAdmissionRejected(std::string_view reason);

    // Request metrics
    void recordRequestStarted(std::string_view priority);
    void recordRequestCompleted(double durationSeconds);
    void recordRequestFailed(std::string_view reason);
    void recordRateLimited(std::string_view action_class);
    void recordRequestRetry();
    void recordSingleFlightJoin();
    void updateInFlightRequests(size_t count);

    // Lifecycle metrics
    void recordLifecycleTransition(std::string_view state);
    void updateIntervalMultiplier(double multiplier);
    void recordPressureSampleFailure();
    void recordTaskRun(std::string_view task_id);
    void recordTaskSkipped(std::string_view task_id);
    void recordTaskFailed(std::string_view task_id);

    // Persistence metrics
    void recordPersistenceFailure(std::string_view operation);

    std::string getMetricsUrl() const;

    private:
    // Null when the collector was built from a disabled config
    std::unique_ptr<PrometheusMetricsImpl> implementation;
};

class GlobalMetrics
{
    public:
    static void initialize(const MetricsConfig &config);
    static void shutdown();

    // Returns a no-op collector until initialize() succeeds
    static MetricsCollector &instance();

    private:
    static std::unique_ptr<MetricsCollector> metrics_instance;
};

} // namespace AdaptiveGovernor

#else // !GOVERNOR_HAVE_PROMETHEUS

// Built without prometheus-cpp: every record call is a no-op
namespace AdaptiveGovernor
{

class MetricsCollector
{
    public:
    explicit MetricsCollector(const MetricsConfig &)
    {
    }
    ~MetricsCollector() = default;

    void recordCacheHit()
    {
    }
    void recordCacheMiss()
    {
    }
    void updateCacheSize(size_t)
    {
    }
    void updateCacheEntryCount(size_t)
    {
    }
    void updateCacheCapacity(size_t)
    {
    }
    void recordCacheEviction(std::string_view = "capacity")
    {
    }
    void recordCacheExpiration(size_t = 1)
    {
    }
    void recordCacheAdmissionRejected(std::string_view)
    {
    }

    void recordRequestStarted(std::string_view)
    {
    }
    void recordRequestCompleted(double)
    {
    }
    void recordRequestFailed(std::string_view)
    {
    }
    void recordRateLimited(std::string_view)
    {
    }
    void recordRequestRetry()
    {
    }
    void recordSingleFlightJoin()
    {
    }
    void updateInFlightRequests(size_t)
    {
    }

    void recordLifecycleTransition(std::string_view)
    {
    }
    void updateIntervalMultiplier(double)
    {
    }
    void recordPressureSampleFailure()
    {
    }
    void recordTaskRun(std::string_view)
    {
    }
    void recordTaskSkipped(std::string_view)
    {
    }
    void recordTaskFailed(std::string_view)
    {
    }

    void recordPersistenceFailure(std::string_view)
    {
    }

    std::string getMetricsUrl() const
    {
        return "metrics disabled";
    }
};

class GlobalMetrics
{
    public:
    static void initialize(const MetricsConfig &)
    {
    }
    static void shutdown()
    {
    }
    static MetricsCollector &instance()
    {
        static MetricsCollector stub_metrics({});
        return stub_metrics;
    }
};

} // namespace AdaptiveGovernor

#endif // GOVERNOR_HAVE_PROMETHEUS
