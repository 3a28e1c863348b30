#pragma once

#include "../types/clock.hpp"
#include "../types/config.hpp"
#include "../types/lifecycle_state.hpp"
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace AdaptiveGovernor
{

// Returns nullopt (or throws) when no reading is available
using PressureSource = std::function<std::optional<PressureSample>()>;
using StateListener = std::function<void(const LifecycleState &previous, const LifecycleState &current)>;
using TaskFn = std::function<void()>;

/**
 * Tracks phase x pressure and turns it into an interval multiplier.
 *
 * The state has a single writer (lifecycle events and pressure sampling,
 * serialized internally) and lock-free readers. Registered tasks run on the
 * scheduler thread with an effective period of base interval x multiplier,
 * re-read every cycle. Under Critical pressure only essential tasks run.
 */
class LifecycleScheduler
{
    public:
    explicit LifecycleScheduler(const SchedulerConfig &config, PressureSource pressure_source = {});
    ~LifecycleScheduler();

    LifecycleScheduler(const LifecycleScheduler &) = delete;
    LifecycleScheduler &operator=(const LifecycleScheduler &) = delete;

    void start();
    void shutdown();

    LifecycleState currentState() const;
    double intervalMultiplier() const;

    // True while only essential periodic work should run
    bool isEssentialOnly() const;

    static double multiplierFor(const MultiplierTable &table, const LifecycleState &state);
    PressureLevel classify(const PressureSample &sample) const;

    void onForeground();
    void onBackground();

    // Holds the last pressure level when the source fails; never throws
    bool samplePressure();

    void addStateListener(StateListener listener);

    bool registerTask(const std::string &id, Milliseconds base_interval, TaskFn run, bool essential = true);
    bool cancelTask(const std::string &id);
    bool hasTask(const std::string &id) const;
    size_t taskCount() const;

    private:
    struct ScheduledTask
    {
        Milliseconds base_interval{};
        TaskFn run{};
        bool essential = true;
        TimePoint anchor{};
        TimePoint next_run{};
    };

    void transition(const std::function<LifecycleState(LifecycleState)> &change, const std::string &reason);
    void notifyListeners(const LifecycleState &previous, const LifecycleState &current);
    void rescheduleLocked(double multiplier);
    Milliseconds effectiveInterval(Milliseconds base_interval, double multiplier) const;
    void schedulerThread();
    void runTask(const std::string &id, const TaskFn &run, bool essential);

    SchedulerConfig config;
    PressureSource pressure_source;

    std::atomic<LifecycleState> state;
    std::mutex transition_mutex;

    std::mutex listeners_mutex;
    std::vector<StateListener> listeners;

    mutable std::mutex task_mutex;
    std::condition_variable task_condition;
    std::map<std::string, ScheduledTask> tasks;
    TimePoint next_sample{};

    std::thread scheduler_thread;
    std::atomic<bool> shutdown_requested{ false };
};

} // namespace AdaptiveGovernor
