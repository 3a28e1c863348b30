#pragma once

#include "../types/config.hpp"
#include "cache_store.hpp"
#include "lifecycle_scheduler.hpp"
#include "persistence.hpp"
#include "request_coordinator.hpp"
#include <memory>

namespace AdaptiveGovernor
{

struct GovernorSnapshot
{
    size_t active_requests{};
    CacheStats cache;
    LifecycleState state;
    double interval_multiplier{ 1.0 };
    size_t scheduled_tasks{};
};

// Owns the component graph and applies lifecycle reactions to the cache:
// Background cleans up, Critical shrinks, Foreground/Normal restores.
class Governor
{
    public:
    static constexpr const char *JANITOR_TASK = "cache-janitor";
    static constexpr const char *RATE_LIMIT_PRUNE_TASK = "rate-limit-prune";

    explicit Governor(const GovernorConfig &config,
                      PressureSource pressure_source = {},
                      std::shared_ptr<PersistenceBackend> persistence = {});
    ~Governor();

    Governor(const Governor &) = delete;
    Governor &operator=(const Governor &) = delete;

    // Restores mirrored entries and starts the scheduler loop
    void start();
    void shutdown();

    CacheStore &cache()
    {
        return cache_store;
    }

    RequestCoordinator &coordinator()
    {
        return request_coordinator;
    }

    LifecycleScheduler &scheduler()
    {
        return lifecycle_scheduler;
    }

    GovernorSnapshot snapshot() const;

    private:
    void onStateChange(const LifecycleState &previous, const LifecycleState &current);

    GovernorConfig config;
    CacheStore cache_store;
    RequestCoordinator request_coordinator;
    LifecycleScheduler lifecycle_scheduler;
    bool stopped = false;
};

} // namespace AdaptiveGovernor
