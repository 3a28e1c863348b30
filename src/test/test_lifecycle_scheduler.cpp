#include <adaptive-governor/lifecycle_scheduler.hpp>
#include <atomic>
#include <catch2/catch.hpp>
#include <chrono>
#include <cmath>
#include <deque>
#include <limits>
#include <mutex>
#include <stdexcept>
#include <thread>

using namespace AdaptiveGovernor;
using namespace std::chrono_literals;

namespace
{

// Replays scripted readings; an empty script reads as "no sample"
class ScriptedPressure
{
    public:
    enum class Step
    {
        VALUE,
        NONE,
        THROW
    };

    void push(double ratio, bool battery_saver = false)
    {
        std::lock_guard<std::mutex> lock(mutex);
        steps.push_back({ Step::VALUE, PressureSample{ ratio, battery_saver } });
    }

    void pushNone()
    {
        std::lock_guard<std::mutex> lock(mutex);
        steps.push_back({ Step::NONE, {} });
    }

    void pushThrow()
    {
        std::lock_guard<std::mutex> lock(mutex);
        steps.push_back({ Step::THROW, {} });
    }

    PressureSource source()
    {
        return [this]() -> std::optional<PressureSample>
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (steps.empty())
            {
                return std::nullopt;
            }

            auto [step, sample] = steps.front();
            steps.pop_front();

            if (step == Step::THROW)
            {
                throw std::runtime_error("sensor unavailable");
            }
            if (step == Step::NONE)
            {
                return std::nullopt;
            }
            return sample;
        };
    }

    private:
    std::mutex mutex;
    std::deque<std::pair<Step, PressureSample>> steps;
};

template <typename Predicate> bool waitFor(Predicate predicate, std::chrono::milliseconds limit = 2000ms)
{
    auto deadline = std::chrono::steady_clock::now() + limit;
    while (std::chrono::steady_clock::now() < deadline)
    {
        if (predicate())
        {
            return true;
        }
        std::this_thread::sleep_for(5ms);
    }
    return predicate();
}

} // namespace

TEST_CASE("LifecycleScheduler - multiplier is a function of the current state", "[scheduler]")
{
    SchedulerConfig config;
    LifecycleScheduler scheduler(config);

    REQUIRE(scheduler.currentState() == LifecycleState{});
    REQUIRE(scheduler.intervalMultiplier() == 1.0);

    scheduler.onBackground();
    REQUIRE(scheduler.currentState().phase == LifecyclePhase::BACKGROUND);
    REQUIRE(scheduler.intervalMultiplier() == 3.0);

    scheduler.onForeground();
    REQUIRE(scheduler.currentState() == LifecycleState{ LifecyclePhase::FOREGROUND, PressureLevel::NORMAL });
    REQUIRE(scheduler.intervalMultiplier() == 1.0);
}

TEST_CASE("LifecycleScheduler - policy table", "[scheduler]")
{
    MultiplierTable table{ { { 1.0, 2.0, 4.0 }, { 8.0, 16.0, 32.0 } } };

    REQUIRE(LifecycleScheduler::multiplierFor(table, { LifecyclePhase::FOREGROUND, PressureLevel::NORMAL }) == 1.0);
    REQUIRE(LifecycleScheduler::multiplierFor(table, { LifecyclePhase::FOREGROUND, PressureLevel::ELEVATED }) == 2.0);
    REQUIRE(LifecycleScheduler::multiplierFor(table, { LifecyclePhase::FOREGROUND, PressureLevel::CRITICAL }) == 4.0);
    REQUIRE(LifecycleScheduler::multiplierFor(table, { LifecyclePhase::BACKGROUND, PressureLevel::NORMAL }) == 8.0);
    REQUIRE(LifecycleScheduler::multiplierFor(table, { LifecyclePhase::BACKGROUND, PressureLevel::ELEVATED }) == 16.0);
    REQUIRE(LifecycleScheduler::multiplierFor(table, { LifecyclePhase::BACKGROUND, PressureLevel::CRITICAL }) == 32.0);
}

TEST_CASE("LifecycleScheduler - pressure classification", "[scheduler]")
{
    SchedulerConfig config;
    config.elevated_threshold = 0.6;
    config.critical_threshold = 0.8;
    LifecycleScheduler scheduler(config);

    REQUIRE(scheduler.classify({ 0.1, false }) == PressureLevel::NORMAL);
    REQUIRE(scheduler.classify({ 0.59, false }) == PressureLevel::NORMAL);
    REQUIRE(scheduler.classify({ 0.6, false }) == PressureLevel::ELEVATED);
    REQUIRE(scheduler.classify({ 0.79, false }) == PressureLevel::ELEVATED);
    REQUIRE(scheduler.classify({ 0.8, false }) == PressureLevel::CRITICAL);
    REQUIRE(scheduler.classify({ 1.0, false }) == PressureLevel::CRITICAL);

    SECTION("Battery saver raises pressure to at least Elevated")
    {
        REQUIRE(scheduler.classify({ 0.1, true }) == PressureLevel::ELEVATED);
        REQUIRE(scheduler.classify({ 0.9, true }) == PressureLevel::CRITICAL);
    }
}

TEST_CASE("LifecycleScheduler - sampling failures hold the last level", "[scheduler]")
{
    ScriptedPressure pressure;
    LifecycleScheduler scheduler(SchedulerConfig{}, pressure.source());

    pressure.push(0.9);
    REQUIRE(scheduler.samplePressure());
    REQUIRE(scheduler.currentState().pressure == PressureLevel::CRITICAL);
    REQUIRE(scheduler.isEssentialOnly());

    pressure.pushThrow();
    REQUIRE_FALSE(scheduler.samplePressure());
    REQUIRE(scheduler.currentState().pressure == PressureLevel::CRITICAL);

    pressure.pushNone();
    REQUIRE_FALSE(scheduler.samplePressure());
    REQUIRE(scheduler.currentState().pressure == PressureLevel::CRITICAL);

    pressure.push(std::numeric_limits<double>::quiet_NaN());
    REQUIRE_FALSE(scheduler.samplePressure());
    pressure.push(1.7);
    REQUIRE_FALSE(scheduler.samplePressure());
    REQUIRE(scheduler.currentState().pressure == PressureLevel::CRITICAL);

    pressure.push(0.2);
    REQUIRE(scheduler.samplePressure());
    REQUIRE(scheduler.currentState().pressure == PressureLevel::NORMAL);
    REQUIRE_FALSE(scheduler.isEssentialOnly());
}

TEST_CASE("LifecycleScheduler - sampling without a source", "[scheduler]")
{
    LifecycleScheduler scheduler(SchedulerConfig{});

    REQUIRE_FALSE(scheduler.samplePressure());
    REQUIRE(scheduler.currentState().pressure == PressureLevel::NORMAL);
}

TEST_CASE("LifecycleScheduler - state listeners", "[scheduler]")
{
    ScriptedPressure pressure;
    LifecycleScheduler scheduler(SchedulerConfig{}, pressure.source());

    std::vector<std::pair<LifecycleState, LifecycleState>> seen;
    scheduler.addStateListener(
    [&seen](const LifecycleState &previous, const LifecycleState &current)
    {
        seen.emplace_back(previous, current);
    });

    scheduler.onBackground();
    scheduler.onBackground();
    pressure.push(0.7);
    scheduler.samplePressure();
    pressure.push(0.65);
    scheduler.samplePressure();

    REQUIRE(seen.size() == 2);
    REQUIRE(seen[0].first == LifecycleState{ LifecyclePhase::FOREGROUND, PressureLevel::NORMAL });
    REQUIRE(seen[0].second == LifecycleState{ LifecyclePhase::BACKGROUND, PressureLevel::NORMAL });
    REQUIRE(seen[1].second == LifecycleState{ LifecyclePhase::BACKGROUND, PressureLevel::ELEVATED });

    SECTION("A throwing listener does not stop the transition")
    {
        scheduler.addStateListener(
        [](const LifecycleState &, const LifecycleState &)
        {
            throw std::runtime_error("listener bug");
        });

        scheduler.onForeground();
        REQUIRE(scheduler.currentState().phase == LifecyclePhase::FOREGROUND);
        REQUIRE(seen.size() == 3);
    }

    SECTION("A listener throwing a non-exception type is contained")
    {
        scheduler.addStateListener(
        [](const LifecycleState &, const LifecycleState &)
        {
            throw 42;
        });

        REQUIRE_NOTHROW(scheduler.onForeground());
        REQUIRE(scheduler.currentState().phase == LifecyclePhase::FOREGROUND);
        REQUIRE(seen.size() == 3);
    }
}

TEST_CASE("LifecycleScheduler - task registration", "[scheduler]")
{
    LifecycleScheduler scheduler(SchedulerConfig{});
    auto noop = [] {};

    REQUIRE(scheduler.registerTask("sync", 100ms, noop));
    REQUIRE_FALSE(scheduler.registerTask("sync", 100ms, noop));
    REQUIRE_FALSE(scheduler.registerTask("zero", 0ms, noop));
    REQUIRE_FALSE(scheduler.registerTask("empty", 100ms, TaskFn{}));
    REQUIRE(scheduler.taskCount() == 1);

    REQUIRE(scheduler.cancelTask("sync"));
    REQUIRE_FALSE(scheduler.cancelTask("sync"));
    REQUIRE_FALSE(scheduler.hasTask("sync"));
}

TEST_CASE("LifecycleScheduler - periodic tasks", "[scheduler]")
{
    SchedulerConfig config;
    config.multipliers[1][0] = 200.0; // Background/Normal
    LifecycleScheduler scheduler(config);

    std::atomic<int> runs{ 0 };
    REQUIRE(scheduler.registerTask("tick", 10ms,
                                   [&runs]
                                   {
                                       runs++;
                                   }));
    scheduler.start();

    REQUIRE(waitFor(
    [&runs]
    {
        return runs >= 3;
    }));

    SECTION("Cancelled task stops running")
    {
        REQUIRE(scheduler.cancelTask("tick"));
        std::this_thread::sleep_for(30ms);
        int after_cancel = runs;
        std::this_thread::sleep_for(100ms);
        REQUIRE(runs == after_cancel);
    }

    SECTION("Period stretches live with the multiplier")
    {
        scheduler.onBackground();
        std::this_thread::sleep_for(30ms);
        int in_background = runs;
        std::this_thread::sleep_for(200ms);
        REQUIRE(runs <= in_background + 1);

        scheduler.onForeground();
        REQUIRE(waitFor(
        [&runs, in_background]
        {
            return runs >= in_background + 3;
        }));
    }

    SECTION("A throwing task keeps its schedule")
    {
        std::atomic<int> attempts{ 0 };
        REQUIRE(scheduler.registerTask("faulty", 10ms,
                                       [&attempts]
                                       {
                                           attempts++;
                                           throw std::runtime_error("task failed");
                                       }));

        REQUIRE(waitFor(
        [&attempts]
        {
            return attempts >= 3;
        }));
    }

    SECTION("A task throwing a non-exception type keeps the loop alive")
    {
        std::atomic<int> attempts{ 0 };
        REQUIRE(scheduler.registerTask("throws-int", 10ms,
                                       [&attempts]
                                       {
                                           attempts++;
                                           throw 42;
                                       }));

        REQUIRE(waitFor(
        [&attempts]
        {
            return attempts >= 3;
        }));

        int before = runs;
        REQUIRE(waitFor(
        [&runs, before]
        {
            return runs >= before + 2;
        }));
    }
}

TEST_CASE("LifecycleScheduler - critical pressure keeps only essential tasks", "[scheduler]")
{
    ScriptedPressure pressure;
    LifecycleScheduler scheduler(SchedulerConfig{}, pressure.source());

    pressure.push(0.95);
    REQUIRE(scheduler.samplePressure());

    std::atomic<int> essential_runs{ 0 };
    std::atomic<int> optional_runs{ 0 };
    REQUIRE(scheduler.registerTask(
    "janitor", 10ms,
    [&essential_runs]
    {
        essential_runs++;
    },
    true));
    REQUIRE(scheduler.registerTask(
    "analytics", 10ms,
    [&optional_runs]
    {
        optional_runs++;
    },
    false));

    scheduler.start();

    // Critical foreground stretches 10 ms to 15 ms
    REQUIRE(waitFor(
    [&essential_runs]
    {
        return essential_runs >= 3;
    }));
    REQUIRE(optional_runs == 0);
    REQUIRE(scheduler.hasTask("analytics"));

    pressure.push(0.1);
    REQUIRE(scheduler.samplePressure());
    REQUIRE(waitFor(
    [&optional_runs]
    {
        return optional_runs >= 1;
    }));
}
