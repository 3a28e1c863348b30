#include "../include/adaptive-governor/lifecycle_scheduler.hpp"
#include "../include/adaptive-governor/logger.hpp"
#include "../include/adaptive-governor/metrics_collector.hpp"
#include <algorithm>
#include <cmath>
#include <tuple>

namespace AdaptiveGovernor
{

LifecycleScheduler::LifecycleScheduler(const SchedulerConfig &config, PressureSource pressure_source)
: config(config), pressure_source(std::move(pressure_source)), state(LifecycleState{})
{
    GlobalMetrics::instance().updateIntervalMultiplier(intervalMultiplier());
}

LifecycleScheduler::~LifecycleScheduler()
{
    shutdown();
}

void LifecycleScheduler::start()
{
    std::lock_guard<std::mutex> lock(task_mutex);

    if (scheduler_thread.joinable() || shutdown_requested)
    {
        return;
    }

    // First cycle takes a pressure reading straight away
    next_sample = SteadyClock::now();
    scheduler_thread = std::thread(&LifecycleScheduler::schedulerThread, this);

    Logger::debug(LogCategory::SCHEDULER, "Scheduler started, sampling every {} ms", config.sample_interval_ms);
}

void LifecycleScheduler::shutdown()
{
    {
        std::lock_guard<std::mutex> lock(task_mutex);
        shutdown_requested = true;
    }

    task_condition.notify_all();

    if (scheduler_thread.joinable() && scheduler_thread.get_id() != std::this_thread::get_id())
    {
        scheduler_thread.join();
    }
}

LifecycleState LifecycleScheduler::currentState() const
{
    return state.load();
}

double LifecycleScheduler::intervalMultiplier() const
{
    return multiplierFor(config.multipliers, currentState());
}

bool LifecycleScheduler::isEssentialOnly() const
{
    return currentState().pressure == PressureLevel::CRITICAL;
}

double LifecycleScheduler::multiplierFor(const MultiplierTable &table, const LifecycleState &state)
{
    return table[static_cast<size_t>(state.phase)][static_cast<size_t>(state.pressure)];
}

PressureLevel LifecycleScheduler::classify(const PressureSample &sample) const
{
    PressureLevel level = PressureLevel::ELEVATED;

    if (sample.memory_ratio >= config.critical_threshold)
    {
        level = PressureLevel::CRITICAL;
    }
    else if (sample.memory_ratio < config.elevated_threshold)
    {
        level = PressureLevel::NORMAL;
    }

    if (sample.battery_saver && level == PressureLevel::NORMAL)
    {
        level = PressureLevel::ELEVATED;
    }

    return level;
}

void LifecycleScheduler::onForeground()
{
    transition(
    [](LifecycleState current)
    {
        current.phase = LifecyclePhase::FOREGROUND;
        return current;
    },
    "foreground event");
}

void LifecycleScheduler::onBackground()
{
    transition(
    [](LifecycleState current)
    {
        current.phase = LifecyclePhase::BACKGROUND;
        return current;
    },
    "background event");
}

bool LifecycleScheduler::samplePressure()
{
    if (!pressure_source)
    {
        return false;
    }

    std::optional<PressureSample> sample;
    try
    {
        sample = pressure_source();
    }
    catch (const std::exception &e)
    {
        Logger::warn(LogCategory::LIFECYCLE, "Pressure sampling failed, holding {}: {}",
                     pressureToString(currentState().pressure), e.what());
        GlobalMetrics::instance().recordPressureSampleFailure();
        return false;
    }
    catch (...)
    {
        Logger::warn(LogCategory::LIFECYCLE, "Pressure sampling failed, holding {}: unknown exception",
                     pressureToString(currentState().pressure));
        GlobalMetrics::instance().recordPressureSampleFailure();
        return false;
    }

    if (!sample || !std::isfinite(sample->memory_ratio) || sample->memory_ratio < 0.0 || sample->memory_ratio > 1.0)
    {
        Logger::warn(LogCategory::LIFECYCLE, "Discarding pressure sample {}, holding {}",
                     sample ? fmt::format("{}", sample->memory_ratio) : std::string("<none>"),
                     pressureToString(currentState().pressure));
        GlobalMetrics::instance().recordPressureSampleFailure();
        return false;
    }

    const PressureLevel level = classify(*sample);
    Logger::trace(LogCategory::LIFECYCLE, "Pressure sample {:.2f} (battery saver {}) -> {}", sample->memory_ratio,
                  sample->battery_saver, pressureToString(level));

    transition(
    [level](LifecycleState current)
    {
        current.pressure = level;
        return current;
    },
    fmt::format("memory ratio {:.2f}{}", sample->memory_ratio, sample->battery_saver ? ", battery saver" : ""));

    return true;
}

void LifecycleScheduler::addStateListener(StateListener listener)
{
    std::lock_guard<std::mutex> lock(listeners_mutex);
    listeners.push_back(std::move(listener));
}

bool LifecycleScheduler::registerTask(const std::string &id, Milliseconds base_interval, TaskFn run, bool essential)
{
    if (base_interval.count() <= 0 || !run)
    {
        Logger::warn(LogCategory::SCHEDULER, "Rejecting task {}: needs a positive interval and a function", id);
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(task_mutex);

        if (tasks.find(id) != tasks.end())
        {
            Logger::warn(LogCategory::SCHEDULER, "Task {} is already registered", id);
            return false;
        }

        const TimePoint now = SteadyClock::now();
        ScheduledTask task;
        task.base_interval = base_interval;
        task.run = std::move(run);
        task.essential = essential;
        task.anchor = now;
        task.next_run = now + effectiveInterval(base_interval, intervalMultiplier());
        tasks.emplace(id, std::move(task));
    }

    Logger::debug(LogCategory::SCHEDULER, "Registered {} task {} every {} ms (x{})",
                  essential ? "essential" : "non-essential", id, base_interval.count(), intervalMultiplier());
    task_condition.notify_all();
    return true;
}

bool LifecycleScheduler::cancelTask(const std::string &id)
{
    bool removed = false;

    {
        std::lock_guard<std::mutex> lock(task_mutex);
        removed = tasks.erase(id) > 0;
    }

    if (removed)
    {
        Logger::debug(LogCategory::SCHEDULER, "Cancelled task {}", id);
        task_condition.notify_all();
    }

    return removed;
}

bool LifecycleScheduler::hasTask(const std::string &id) const
{
    std::lock_guard<std::mutex> lock(task_mutex);
    return tasks.find(id) != tasks.end();
}

size_t LifecycleScheduler::taskCount() const
{
    std::lock_guard<std::mutex> lock(task_mutex);
    return tasks.size();
}

void LifecycleScheduler::transition(const std::function<LifecycleState(LifecycleState)> &change, const std::string &reason)
{
    LifecycleState previous;
    LifecycleState current;

    {
        std::lock_guard<std::mutex> lock(transition_mutex);
        previous = state.load();
        current = change(previous);

        if (current == previous)
        {
            return;
        }

        state.store(current);
    }

    const double multiplier = multiplierFor(config.multipliers, current);
    Logger::info(LogCategory::LIFECYCLE, "{} -> {} ({}), interval multiplier {}", stateToString(previous),
                 stateToString(current), reason, multiplier);

    auto &metrics = GlobalMetrics::instance();
    metrics.recordLifecycleTransition(stateToString(current));
    metrics.updateIntervalMultiplier(multiplier);

    {
        std::lock_guard<std::mutex> lock(task_mutex);
        rescheduleLocked(multiplier);
    }
    task_condition.notify_all();

    notifyListeners(previous, current);
}

void LifecycleScheduler::notifyListeners(const LifecycleState &previous, const LifecycleState &current)
{
    std::vector<StateListener> snapshot;

    {
        std::lock_guard<std::mutex> lock(listeners_mutex);
        snapshot = listeners;
    }

    for (const auto &listener : snapshot)
    {
        try
        {
            listener(previous, current);
        }
        catch (const std::exception &e)
        {
            Logger::error(LogCategory::LIFECYCLE, "State listener failed on {}: {}", stateToString(current), e.what());
            GlobalMetrics::instance().recordTaskFailed("state-listener");
        }
        catch (...)
        {
            Logger::error(LogCategory::LIFECYCLE, "State listener failed on {}: unknown exception", stateToString(current));
            GlobalMetrics::instance().recordTaskFailed("state-listener");
        }
    }
}

void LifecycleScheduler::rescheduleLocked(double multiplier)
{
    for (auto &[id, task] : tasks)
    {
        task.next_run = task.anchor + effectiveInterval(task.base_interval, multiplier);
    }
}

Milliseconds LifecycleScheduler::effectiveInterval(Milliseconds base_interval, double multiplier) const
{
    auto scaled = static_cast<int64_t>(std::llround(static_cast<double>(base_interval.count()) * multiplier));
    return Milliseconds(std::max<int64_t>(1, scaled));
}

void LifecycleScheduler::schedulerThread()
{
    std::unique_lock<std::mutex> lock(task_mutex);

    while (!shutdown_requested)
    {
        TimePoint wake = TimePoint::max();
        for (const auto &[id, task] : tasks)
        {
            wake = std::min(wake, task.next_run);
        }
        if (pressure_source)
        {
            wake = std::min(wake, next_sample);
        }

        if (wake == TimePoint::max())
        {
            task_condition.wait(lock);
        }
        else
        {
            task_condition.wait_until(lock, wake);
        }

        if (shutdown_requested)
        {
            break;
        }

        const TimePoint now = SteadyClock::now();
        const double multiplier = intervalMultiplier();

        std::vector<std::tuple<std::string, TaskFn, bool>> due;
        for (auto &[id, task] : tasks)
        {
            if (task.next_run <= now)
            {
                due.emplace_back(id, task.run, task.essential);
                task.anchor = now;
                task.next_run = now + effectiveInterval(task.base_interval, multiplier);
            }
        }

        bool sample_due = pressure_source && next_sample <= now;
        if (sample_due)
        {
            next_sample = now + Milliseconds(config.sample_interval_ms);
        }

        lock.unlock();

        if (sample_due)
        {
            samplePressure();
        }

        for (const auto &[id, run, essential] : due)
        {
            runTask(id, run, essential);
        }

        lock.lock();
    }

    Logger::debug(LogCategory::SCHEDULER, "Scheduler thread exiting");
}

void LifecycleScheduler::runTask(const std::string &id, const TaskFn &run, bool essential)
{
    if (!essential && isEssentialOnly())
    {
        Logger::trace(LogCategory::SCHEDULER, "Skipping non-essential task {} under critical pressure", id);
        GlobalMetrics::instance().recordTaskSkipped(id);
        return;
    }

    try
    {
        run();
        GlobalMetrics::instance().recordTaskRun(id);
    }
    catch (const std::exception &e)
    {
        Logger::error(LogCategory::SCHEDULER, "Task {} failed: {}", id, e.what());
        GlobalMetrics::instance().recordTaskFailed(id);
    }
    catch (...)
    {
        Logger::error(LogCategory::SCHEDULER, "Task {} failed: unknown exception", id);
        GlobalMetrics::instance().recordTaskFailed(id);
    }
}

} // namespace AdaptiveGovernor
