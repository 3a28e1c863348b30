#include "../include/adaptive-governor/governor.hpp"
#include "../include/adaptive-governor/logger.hpp"
#include <cmath>

namespace AdaptiveGovernor
{

Governor::Governor(const GovernorConfig &config, PressureSource pressure_source, std::shared_ptr<PersistenceBackend> persistence)
: config(config), cache_store(config.cache), request_coordinator(cache_store, config.requests),
  lifecycle_scheduler(config.scheduler, std::move(pressure_source))
{
    if (!persistence && config.persistence.enabled)
    {
        persistence = std::make_shared<JsonFilePersistence>(config.persistence.path);
        Logger::info(LogCategory::PERSISTENCE, "Mirroring cache to {}", config.persistence.path);
    }

    if (persistence)
    {
        cache_store.setPersistenceBackend(std::move(persistence));
    }

    lifecycle_scheduler.addStateListener(
    [this](const LifecycleState &previous, const LifecycleState &current)
    {
        onStateChange(previous, current);
    });

    lifecycle_scheduler.registerTask(
    JANITOR_TASK, Milliseconds(config.scheduler.janitor_interval_ms),
    [this]
    {
        cache_store.runJanitorPass();
    },
    true);

    lifecycle_scheduler.registerTask(
    RATE_LIMIT_PRUNE_TASK, Milliseconds(config.scheduler.rate_limit_prune_interval_ms),
    [this]
    {
        request_coordinator.pruneRateLimitWindows();
    },
    false);
}

Governor::~Governor()
{
    shutdown();
}

void Governor::start()
{
    size_t restored = cache_store.restoreFromPersistence();
    if (restored > 0)
    {
        Logger::info(LogCategory::GENERAL, "Warm start with {} cached entries", restored);
    }

    lifecycle_scheduler.start();
}

void Governor::shutdown()
{
    if (stopped)
    {
        return;
    }
    stopped = true;

    lifecycle_scheduler.shutdown();
    request_coordinator.shutdown();
    cache_store.flushPersistence();
}

GovernorSnapshot Governor::snapshot() const
{
    GovernorSnapshot result;
    result.active_requests = request_coordinator.activeRequests();
    result.cache = cache_store.stats();
    result.state = lifecycle_scheduler.currentState();
    result.interval_multiplier = lifecycle_scheduler.intervalMultiplier();
    result.scheduled_tasks = lifecycle_scheduler.taskCount();
    return result;
}

void Governor::onStateChange(const LifecycleState &previous, const LifecycleState &current)
{
    if (current.phase == LifecyclePhase::BACKGROUND && previous.phase != LifecyclePhase::BACKGROUND)
    {
        cache_store.aggressiveCleanup();
    }

    if (current.pressure == PressureLevel::CRITICAL && previous.pressure != PressureLevel::CRITICAL)
    {
        auto target = static_cast<size_t>(
        std::llround(static_cast<double>(config.cache.capacity_bytes) * config.cache.critical_capacity_ratio));
        Logger::warn(LogCategory::LIFECYCLE, "Critical pressure, shrinking cache to {} bytes", target);
        cache_store.shrinkTo(target);
    }

    if (current.phase == LifecyclePhase::FOREGROUND && current.pressure == PressureLevel::NORMAL)
    {
        cache_store.restoreCapacity();
        cache_store.restoreFromPersistence();
    }
}

} // namespace AdaptiveGovernor
