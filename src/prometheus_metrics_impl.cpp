#include "../include/adaptive-governor/prometheus_metrics_impl.hpp"

#ifdef GOVERNOR_HAVE_PROMETHEUS

#include "../include/adaptive-governor/logger.hpp"
#include <prometheus/counter.h>
#include <prometheus/exposer.h>
#include <prometheus/gauge.h>
#include <prometheus/histogram.h>
#include <prometheus/registry.h>

namespace AdaptiveGovernor
{

namespace
{

prometheus::Counter &labelled(prometheus::Family<prometheus::Counter> *family, const char *label, std::string_view value)
{
    return family->Add({ { label, std::string(value) } });
}

} // namespace

PrometheusMetricsImpl::PrometheusMetricsImpl(const MetricsConfig &config) : config(config)
{
    try
    {
        std::string bindAddr = config.bind_address + ":" + std::to_string(config.port);
        exposer = std::make_unique<prometheus::Exposer>(bindAddr, 2);
        registry = std::make_shared<prometheus::Registry>();
        exposer->RegisterCollectable(registry, config.endpoint_path);

        // Cache store
        cacheHitsTotal = &prometheus::BuildCounter()
                          .Name("governor_cache_hits_total")
                          .Help("Cache lookups that returned a live entry")
                          .Register(*registry)
                          .Add({});

        cacheMissesTotal = &prometheus::BuildCounter()
                            .Name("governor_cache_misses_total")
                            .Help("Cache lookups that found nothing or an expired entry")
                            .Register(*registry)
                            .Add({});

        cacheSizeBytes = &prometheus::BuildGauge()
                          .Name("governor_cache_size_bytes")
                          .Help("Sum of live payload sizes")
                          .Register(*registry)
                          .Add({});

        cacheEntriesTotal = &prometheus::BuildGauge()
                             .Name("governor_cache_entries")
                             .Help("Number of live cache entries")
                             .Register(*registry)
                             .Add({});

        cacheCapacityBytes = &prometheus::BuildGauge()
                              .Name("governor_cache_capacity_bytes")
                              .Help("Current cache capacity")
                              .Register(*registry)
                              .Add({});

        cacheEvictionsFamily = &prometheus::BuildCounter()
                                .Name("governor_cache_evictions_total")
                                .Help("Entries evicted, by reason")
                                .Register(*registry);

        cacheExpirationsTotal = &prometheus::BuildCounter()
                                 .Name("governor_cache_expirations_total")
                                 .Help("Entries removed after their TTL elapsed")
                                 .Register(*registry)
                                 .Add({});

        cacheAdmissionsRejectedFamily = &prometheus::BuildCounter()
                                         .Name("governor_cache_admissions_rejected_total")
                                         .Help("Writes refused by the cache, by reason")
                                         .Register(*registry);

        // Request coordinator
        requestsStartedFamily = &prometheus::BuildCounter()
                                 .Name("governor_requests_started_total")
                                 .Help("Executions started, by priority")
                                 .Register(*registry);

        requestsCompletedTotal = &prometheus::BuildCounter()
                                  .Name("governor_requests_completed_total")
                                  .Help("Executions that produced a value")
                                  .Register(*registry)
                                  .Add({});

        requestsFailedFamily = &prometheus::BuildCounter()
                                .Name("governor_requests_failed_total")
                                .Help("Executions that settled with an error, by reason")
                                .Register(*registry);

        requestsRateLimitedFamily = &prometheus::BuildCounter()
                                     .Name("governor_requests_rate_limited_total")
                                     .Help("Calls refused by the rate limiter, by action class")
                                     .Register(*registry);

        requestRetriesTotal = &prometheus::BuildCounter()
                               .Name("governor_request_retries_total")
                               .Help("Attempts beyond the first")
                               .Register(*registry)
                               .Add({});

        singleFlightJoinsTotal = &prometheus::BuildCounter()
                                  .Name("governor_single_flight_joins_total")
                                  .Help("Calls that attached to an execution already in flight")
                                  .Register(*registry)
                                  .Add({});

        inFlightRequests = &prometheus::BuildGauge()
                            .Name("governor_in_flight_requests")
                            .Help("Executions currently in flight")
                            .Register(*registry)
                            .Add({});

        auto requestDurationBuckets =
        prometheus::Histogram::BucketBoundaries{ 0.005, 0.01, 0.05, 0.1, 0.25, 0.5, 1.0, 2.5, 5.0, 15.0, 30.0 };
        requestDurationSeconds = &prometheus::BuildHistogram()
                                  .Name("governor_request_duration_seconds")
                                  .Help("Time from execution start to settlement")
                                  .Register(*registry)
                                  .Add({}, requestDurationBuckets);

        // Lifecycle scheduler
        lifecycleTransitionsFamily = &prometheus::BuildCounter()
                                      .Name("governor_lifecycle_transitions_total")
                                      .Help("Lifecycle state changes, by new state")
                                      .Register(*registry);

        intervalMultiplier = &prometheus::BuildGauge()
                              .Name("governor_interval_multiplier")
                              .Help("Current periodic interval multiplier")
                              .Register(*registry)
                              .Add({});

        pressureSampleFailuresTotal = &prometheus::BuildCounter()
                                       .Name("governor_pressure_sample_failures_total")
                                       .Help("Pressure samples that could not be read")
                                       .Register(*registry)
                                       .Add({});

        taskRunsFamily = &prometheus::BuildCounter()
                          .Name("governor_task_runs_total")
                          .Help("Scheduled task executions, by task")
                          .Register(*registry);

        taskSkipsFamily = &prometheus::BuildCounter()
                           .Name("governor_task_skips_total")
                           .Help("Scheduled task cycles skipped under critical pressure, by task")
                           .Register(*registry);

        taskFailuresFamily = &prometheus::BuildCounter()
                              .Name("governor_task_failures_total")
                              .Help("Scheduled tasks and state listeners that threw, by task")
                              .Register(*registry);

        persistenceFailuresFamily = &prometheus::BuildCounter()
                                     .Name("governor_persistence_failures_total")
                                     .Help("Durable mirror operations that failed, by operation")
                                     .Register(*registry);

        Logger::info(LogCategory::METRICS, "Metrics server started on {}{}", bindAddr, config.endpoint_path);
    }
    catch (const std::exception &e)
    {
        Logger::error(LogCategory::METRICS, "Failed to initialize metrics: {}", e.what());
        throw;
    }
}

PrometheusMetricsImpl::~PrometheusMetricsImpl() = default;

void PrometheusMetricsImpl::recordCacheHit()
{
    cacheHitsTotal->Increment();
}

void PrometheusMetricsImpl::recordCacheMiss()
{
    cacheMissesTotal->Increment();
}

void PrometheusMetricsImpl::updateCacheSize(size_t bytes)
{
    cacheSizeBytes->Set(static_cast<double>(bytes));
}

void PrometheusMetricsImpl::updateCacheEntryCount(size_t count)
{
    cacheEntriesTotal->Set(static_cast<double>(count));
}

void PrometheusMetricsImpl::updateCacheCapacity(size_t bytes)
{
    cacheCapacityBytes->Set(static_cast<double>(bytes));
}

void PrometheusMetricsImpl::recordCacheEviction(std::string_view reason)
{
    labelled(cacheEvictionsFamily, "reason", reason).Increment();
}

void PrometheusMetricsImpl::recordCacheExpiration(size_t count)
{
    cacheExpirationsTotal->Increment(static_cast<double>(count));
}

void PrometheusMetricsImpl::recordCacheAdmissionRejected(std::string_view reason)
{
    labelled(cacheAdmissionsRejectedFamily, "reason", reason).Increment();
}

void PrometheusMetricsImpl::recordRequestStarted(std::string_view priority)
{
    labelled(requestsStartedFamily, "priority", priority).Increment();
}

void PrometheusMetricsImpl::recordRequestCompleted(double durationSeconds)
{
    requestsCompletedTotal->Increment();
    requestDurationSeconds->Observe(durationSeconds);
}

void PrometheusMetricsImpl::recordRequestFailed(std::string_view reason)
{
    labelled(requestsFailedFamily, "reason", reason).Increment();
}

void PrometheusMetricsImpl::recordRateLimited(std::string_view action_class)
{
    labelled(requestsRateLimitedFamily, "action_class", action_class).Increment();
}

void PrometheusMetricsImpl::recordRequestRetry()
{
    requestRetriesTotal->Increment();
}

void PrometheusMetricsImpl::recordSingleFlightJoin()
{
    singleFlightJoinsTotal->Increment();
}

void PrometheusMetricsImpl::updateInFlightRequests(size_t count)
{
    inFlightRequests->Set(static_cast<double>(count));
}

void PrometheusMetricsImpl::recordLifecycleTransition(std::string_view state)
{
    labelled(lifecycleTransitionsFamily, "state", state).Increment();
}

void PrometheusMetricsImpl::updateIntervalMultiplier(double multiplier)
{
    intervalMultiplier->Set(multiplier);
}

void PrometheusMetricsImpl::recordPressureSampleFailure()
{
    pressureSampleFailuresTotal->Increment();
}

void PrometheusMetricsImpl::recordTaskRun(std::string_view task_id)
{
    labelled(taskRunsFamily, "task", task_id).Increment();
}

void PrometheusMetricsImpl::recordTaskSkipped(std::string_view task_id)
{
    labelled(taskSkipsFamily, "task", task_id).Increment();
}

void PrometheusMetricsImpl::recordTaskFailed(std::string_view task_id)
{
    labelled(taskFailuresFamily, "task", task_id).Increment();
}

void PrometheusMetricsImpl::recordPersistenceFailure(std::string_view operation)
{
    labelled(persistenceFailuresFamily, "operation", operation).Increment();
}

std::string PrometheusMetricsImpl::getMetricsUrl() const
{
    return "http://" + config.bind_address + ":" + std::to_string(config.port) + config.endpoint_path;
}

} // namespace AdaptiveGovernor

#endif // GOVERNOR_HAVE_PROMETHEUS
