#pragma once

#ifdef GOVERNOR_HAVE_PROMETHEUS

#include "../types/config.hpp"
#include <memory>
#include <string>
#include <string_view>

namespace prometheus
{
class Registry;
class Exposer;
template <typename T>
class Family;
class Counter;
class Gauge;
class Histogram;
} // namespace prometheus

namespace AdaptiveGovernor
{

class PrometheusMetricsImpl
{
    public:
    explicit PrometheusMetricsImpl(const MetricsConfig &config);
    ~PrometheusMetricsImpl();

    // Cache metrics
    void recordCacheHit();
    void recordCacheMiss();
    void updateCacheSize(size_t bytes);
    void updateCacheEntryCount(size_t count);
    void updateCacheCapacity(size_t bytes);
    void recordCacheEviction(std::string_view reason);
    void recordCacheExpiration(size_t count);
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
    MetricsConfig config;
    std::unique_ptr<prometheus::Exposer> exposer;
    std::shared_ptr<prometheus::Registry> registry;

    prometheus::Counter *cacheHitsTotal;
    prometheus::Counter *cacheMissesTotal;
    prometheus::Gauge *cacheSizeBytes;
    prometheus::Gauge *cacheEntriesTotal;
    prometheus::Gauge *cacheCapacityBytes;
    prometheus::Family<prometheus::Counter> *cacheEvictionsFamily;
    prometheus::Counter *cacheExpirationsTotal;
    prometheus::Family<prometheus::Counter> *cacheAdmissionsRejectedFamily;

    prometheus::Family<prometheus::Counter> *requestsStartedFamily;
    prometheus::Counter *requestsCompletedTotal;
    prometheus::Family<prometheus::Counter> *requestsFailedFamily;
    prometheus::Family<prometheus::Counter> *requestsRateLimitedFamily;
    prometheus::Counter *requestRetriesTotal;
    prometheus::Counter *singleFlightJoinsTotal;
    prometheus::Gauge *inFlightRequests;
    prometheus::Histogram *requestDurationSeconds;

    prometheus::Family<prometheus::Counter> *lifecycleTransitionsFamily;
    prometheus::Gauge *intervalMultiplier;
    prometheus::Counter *pressureSampleFailuresTotal;
    prometheus::Family<prometheus::Counter> *taskRunsFamily;
    prometheus::Family<prometheus::Counter> *taskSkipsFamily;
    prometheus::Family<prometheus::Counter> *taskFailuresFamily;

    prometheus::Family<prometheus::Counter> *persistenceFailuresFamily;
};

} // namespace AdaptiveGovernor

#endif // GOVERNOR_HAVE_PROMETHEUS
