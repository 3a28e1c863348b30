#include "../include/adaptive-governor/metrics_collector.hpp"

#ifdef GOVERNOR_HAVE_PROMETHEUS

#include "../include/adaptive-governor/logger.hpp"

namespace AdaptiveGovernor
{

MetricsCollector::MetricsCollector(const MetricsConfig &config)
{
    if (config.enabled)
    {
        implementation = std::make_unique<PrometheusMetricsImpl>(config);
    }
}

MetricsCollector::~MetricsCollector() = default;

void MetricsCollector::recordCacheHit()
{
    if (implementation)
    {
        implementation->recordCacheHit();
    }
}

void MetricsCollector::recordCacheMiss()
{
    if (implementation)
    {
        implementation->recordCacheMiss();
    }
}

void MetricsCollector::updateCacheSize(size_t bytes)
{
    if (implementation)
    {
        implementation->updateCacheSize(bytes);
    }
}

void MetricsCollector::updateCacheEntryCount(size_t count)
{
    if (implementation)
    {
        implementation->updateCacheEntryCount(count);
    }
}

void MetricsCollector::updateCacheCapacity(size_t bytes)
{
    if (implementation)
    {
        implementation->updateCacheCapacity(bytes);
    }
}

void MetricsCollector::recordCacheEviction(std::string_view reason)
{
    if (implementation)
    {
        implementation->recordCacheEviction(reason);
    }
}

void MetricsCollector::recordCacheExpiration(size_t count)
{
    if (implementation)
    {
        implementation->recordCacheExpiration(count);
    }
}

void MetricsCollector::recordCacheAdmissionRejected(std::string_view reason)
{
    if (implementation)
    {
        implementation->recordCacheAdmissionRejected(reason);
    }
}

void MetricsCollector::recordRequestStarted(std::string_view priority)
{
    if (implementation)
    {
        implementation->recordRequestStarted(priority);
    }
}

void MetricsCollector::recordRequestCompleted(double durationSeconds)
{
    if (implementation)
    {
        implementation->recordRequestCompleted(durationSeconds);
    }
}

void MetricsCollector::recordRequestFailed(std::string_view reason)
{
    if (implementation)
    {
        implementation->recordRequestFailed(reason);
    }
}

void MetricsCollector::recordRateLimited(std::string_view action_class)
{
    if (implementation)
    {
        implementation->recordRateLimited(action_class);
    }
}

void MetricsCollector::recordRequestRetry()
{
    if (implementation)
    {
        implementation->recordRequestRetry();
    }
}

void MetricsCollector::recordSingleFlightJoin()
{
    if (implementation)
    {
        implementation->recordSingleFlightJoin();
    }
}

void MetricsCollector::updateInFlightRequests(size_t count)
{
    if (implementation)
    {
        implementation->updateInFlightRequests(count);
    }
}

void MetricsCollector::recordLifecycleTransition(std::string_view state)
{
    if (implementation)
    {
        implementation->recordLifecycleTransition(state);
    }
}

void MetricsCollector::updateIntervalMultiplier(double multiplier)
{
    if (implementation)
    {
        implementation->updateIntervalMultiplier(multiplier);
    }
}

void MetricsCollector::recordPressureSampleFailure()
{
    if (implementation)
    {
        implementation->recordPressureSampleFailure();
    }
}

void MetricsCollector::recordTaskRun(std::string_view task_id)
{
    if (implementation)
    {
        implementation->recordTaskRun(task_id);
    }
}

void MetricsCollector::recordTaskSkipped(std::string_view task_id)
{
    if (implementation)
    {
        implementation->recordTaskSkipped(task_id);
    }
}

void MetricsCollector::recordTaskFailed(std::string_view task_id)
{
    if (implementation)
    {
        implementation->recordTaskFailed(task_id);
    }
}

void MetricsCollector::recordPersistenceFailure(std::string_view operation)
{
    if (implementation)
    {
        implementation->recordPersistenceFailure(operation);
    }
}

std::string MetricsCollector::getMetricsUrl() const
{
    if (implementation)
    {
        return implementation->getMetricsUrl();
    }
    return "metrics disabled";
}

std::unique_ptr<MetricsCollector> GlobalMetrics::metrics_instance = nullptr;

MetricsCollector &GlobalMetrics::instance()
{
    if (!metrics_instance)
    {
        static MetricsCollector no_op_metrics({});
        return no_op_metrics;
    }

    return *metrics_instance;
}

void GlobalMetrics::initialize(const MetricsConfig &config)
{
    if (!config.enabled)
    {
        Logger::info(LogCategory::METRICS, "Metrics disabled in configuration");
        metrics_instance = nullptr;
        return;
    }

    try
    {
        metrics_instance = std::make_unique<MetricsCollector>(config);
        Logger::info(LogCategory::METRICS, "Global metrics initialized: {}", metrics_instance->getMetricsUrl());
    }
    catch (const std::exception &e)
    {
        Logger::error(LogCategory::METRICS, "Failed to initialize global metrics: {}", e.what());
        metrics_instance = nullptr;
    }
}

void GlobalMetrics::shutdown()
{
    metrics_instance.reset();
}

} // namespace AdaptiveGovernor

#endif // GOVERNOR_HAVE_PROMETHEUS
