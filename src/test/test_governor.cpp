#include <adaptive-governor/governor.hpp>
#include <atomic>
#include <catch2/catch.hpp>
#include <filesystem>
#include <string>

using namespace AdaptiveGovernor;

namespace
{

GovernorConfig smallGovernor()
{
    GovernorConfig config;
    config.cache.capacity_bytes = 1000;
    config.cache.min_capacity_bytes = 200;
    config.cache.aggressive_shrink_ratio = 0.7;
    config.cache.critical_capacity_ratio = 0.5;
    config.requests.timeout_ms = 1000;
    config.requests.backoff_base_ms = 10;
    return config;
}

Payload filler(size_t size)
{
    return Payload(size, 0x11);
}

} // namespace

TEST_CASE("Governor - wiring", "[governor]")
{
    Governor governor(smallGovernor());

    REQUIRE(governor.scheduler().hasTask(Governor::JANITOR_TASK));
    REQUIRE(governor.scheduler().hasTask(Governor::RATE_LIMIT_PRUNE_TASK));

    RequestResult result = governor.coordinator().execute("feed:1",
                                                          []
                                                          {
                                                              return Payload{ 1, 2, 3 };
                                                          });
    REQUIRE(result.ok());
    REQUIRE(governor.cache().contains("feed:1"));

    GovernorSnapshot snapshot = governor.snapshot();
    REQUIRE(snapshot.active_requests == 0);
    REQUIRE(snapshot.cache.entry_count == 1);
    REQUIRE(snapshot.state == LifecycleState{});
    REQUIRE(snapshot.interval_multiplier == 1.0);
    REQUIRE(snapshot.scheduled_tasks == 2);
}

TEST_CASE("Governor - lifecycle reactions", "[governor]")
{
    std::atomic<double> memory{ 0.2 };
    Governor governor(smallGovernor(),
                      [&memory]() -> std::optional<PressureSample>
                      {
                          return PressureSample{ memory.load(), false };
                      });

    auto &cache = governor.cache();
    for (int i = 0; i < 8; ++i)
    {
        REQUIRE(cache.put("item:" + std::to_string(i), filler(100)) == GovernorStatus::SUCCESS);
    }
    for (int i = 0; i < 4; ++i)
    {
        for (int reads = 0; reads < 3; ++reads)
        {
            REQUIRE(cache.get("item:" + std::to_string(i)).has_value());
        }
    }

    SECTION("Background drops cold entries and shrinks capacity")
    {
        governor.scheduler().onBackground();

        REQUIRE(cache.capacity() == 700);
        REQUIRE(cache.stats().entry_count == 4);
        REQUIRE(cache.contains("item:0"));
        REQUIRE_FALSE(cache.contains("item:7"));
    }

    SECTION("Critical pressure shrinks to the critical ratio")
    {
        memory = 0.95;
        REQUIRE(governor.scheduler().samplePressure());

        REQUIRE(cache.capacity() == 500);
        REQUIRE(cache.stats().size_bytes <= 500);
    }

    SECTION("Foreground with normal pressure restores capacity")
    {
        governor.scheduler().onBackground();
        memory = 0.95;
        governor.scheduler().samplePressure();
        REQUIRE(cache.capacity() == 500);

        memory = 0.3;
        governor.scheduler().samplePressure();
        REQUIRE(cache.capacity() == 500);

        governor.scheduler().onForeground();
        REQUIRE(cache.capacity() == 1000);
    }
}

TEST_CASE("Governor - warm start from the persistence mirror", "[governor][persistence]")
{
    auto path = std::filesystem::temp_directory_path() / "adaptive_governor_warm_start.json";
    std::filesystem::remove(path);

    GovernorConfig config = smallGovernor();
    config.persistence.enabled = true;
    config.persistence.path = path.string();

    {
        Governor first(config);
        first.start();
        REQUIRE(first.cache().put("profile:me", Payload{ 'o', 'k' }) == GovernorStatus::SUCCESS);
        first.shutdown();
    }

    Governor second(config);
    second.start();
    REQUIRE(second.cache().get("profile:me") == Payload{ 'o', 'k' });
    second.shutdown();

    std::filesystem::remove(path);
}
