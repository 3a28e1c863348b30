#include "manual_clock.hpp"
#include <adaptive-governor/request_coordinator.hpp>
#include <adaptive-governor/worker_pool.hpp>
#include <atomic>
#include <catch2/catch.hpp>
#include <chrono>
#include <future>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace AdaptiveGovernor;
using namespace std::chrono_literals;

namespace
{

RequestConfig fastRequests()
{
    RequestConfig config;
    config.timeout_ms = 1000;
    config.max_attempts = 3;
    config.backoff_base_ms = 10;
    config.max_concurrent = 2;
    config.worker_threads = 4;
    config.rate_limit.max_requests = 1000;
    return config;
}

CacheConfig roomyCache()
{
    CacheConfig config;
    config.capacity_bytes = 1024 * 1024;
    return config;
}

Payload text(const std::string &value)
{
    return Payload(value.begin(), value.end());
}

} // namespace

TEST_CASE("RequestCoordinator - caching", "[request]")
{
    CacheStore cache(roomyCache());
    RequestCoordinator coordinator(cache, fastRequests());
    std::atomic<int> calls{ 0 };

    auto work = [&calls]
    {
        calls++;
        return text("fresh");
    };

    SECTION("Second call is served from the cache")
    {
        REQUIRE(coordinator.execute("feed:1", work).ok());
        RequestResult second = coordinator.execute("feed:1", work);

        REQUIRE(second.ok());
        REQUIRE(second.value == text("fresh"));
        REQUIRE(calls == 1);
        REQUIRE(cache.contains("feed:1"));
    }

    SECTION("use_cache off always executes and never writes")
    {
        RequestOptions options;
        options.use_cache = false;

        REQUIRE(coordinator.execute("feed:1", work, options).ok());
        REQUIRE(coordinator.execute("feed:1", work, options).ok());
        REQUIRE(calls == 2);
        REQUIRE_FALSE(cache.contains("feed:1"));
    }

    SECTION("Failures are not cached")
    {
        RequestOptions options;
        options.retry = false;

        auto failing = [&calls]() -> Payload
        {
            calls++;
            throw std::runtime_error("upstream down");
        };

        REQUIRE_FALSE(coordinator.execute("feed:1", failing, options).ok());
        REQUIRE(coordinator.execute("feed:1", work, options).ok());
        REQUIRE(calls == 2);
    }

    SECTION("A result too large to cache still succeeds")
    {
        CacheConfig tiny;
        tiny.capacity_bytes = 4;
        tiny.min_capacity_bytes = 0;
        CacheStore small_cache(tiny);
        RequestCoordinator small(small_cache, fastRequests());

        RequestResult result = small.execute("feed:big", work);

        REQUIRE(result.ok());
        REQUIRE(result.value == text("fresh"));
        REQUIRE_FALSE(small_cache.contains("feed:big"));
    }
}

TEST_CASE("RequestCoordinator - single flight", "[request]")
{
    CacheStore cache(roomyCache());
    RequestCoordinator coordinator(cache, fastRequests());
    std::atomic<int> calls{ 0 };

    auto slow = [&calls]
    {
        calls++;
        std::this_thread::sleep_for(200ms);
        return text("shared");
    };

    const int callers = 8;
    std::vector<std::future<RequestResult>> results;
    for (int i = 0; i < callers; ++i)
    {
        results.push_back(std::async(std::launch::async,
                                     [&]
                                     {
                                         return coordinator.execute("video:7", slow);
                                     }));
    }

    for (auto &result : results)
    {
        RequestResult value = result.get();
        REQUIRE(value.ok());
        REQUIRE(value.value == text("shared"));
    }

    REQUIRE(calls == 1);
    REQUIRE(coordinator.activeRequests() == 0);
}

TEST_CASE("RequestCoordinator - joiners share a failure", "[request]")
{
    CacheStore cache(roomyCache());
    RequestCoordinator coordinator(cache, fastRequests());
    std::atomic<int> calls{ 0 };

    RequestOptions options;
    options.retry = false;
    options.use_cache = false;

    auto failing = [&calls]() -> Payload
    {
        calls++;
        std::this_thread::sleep_for(200ms);
        throw std::runtime_error("boom");
    };

    auto first = std::async(std::launch::async,
                            [&]
                            {
                                return coordinator.execute("video:9", failing, options);
                            });
    std::this_thread::sleep_for(50ms);
    RequestResult joined = coordinator.execute("video:9", failing, options);
    RequestResult original = first.get();

    REQUIRE(calls == 1);
    REQUIRE(joined.status == GovernorStatus::WORK_FAILED);
    REQUIRE(original.status == GovernorStatus::WORK_FAILED);
    REQUIRE(joined.error_message == original.error_message);

    SECTION("A call after settlement starts a fresh execution")
    {
        coordinator.execute("video:9", failing, options);
        REQUIRE(calls == 2);
    }
}

TEST_CASE("RequestCoordinator - timeout", "[request]")
{
    CacheStore cache(roomyCache());
    RequestConfig config = fastRequests();
    config.timeout_ms = 50;
    RequestCoordinator coordinator(cache, config);

    RequestOptions options;
    options.retry = false;

    auto start = std::chrono::steady_clock::now();
    RequestResult result = coordinator.execute(
    "slow:1",
    []
    {
        std::this_thread::sleep_for(400ms);
        return text("late");
    },
    options);
    auto elapsed = std::chrono::steady_clock::now() - start;

    REQUIRE(result.status == GovernorStatus::TIMEOUT);
    REQUIRE(elapsed < 350ms);
    REQUIRE(coordinator.activeRequests() == 0);
    REQUIRE_FALSE(cache.contains("slow:1"));
}

TEST_CASE("RequestCoordinator - queue wait does not count against the timeout", "[request]")
{
    CacheStore cache(roomyCache());
    RequestConfig config = fastRequests();
    config.timeout_ms = 100;
    config.worker_threads = 1;
    config.max_concurrent = 1;
    RequestCoordinator coordinator(cache, config);

    RequestOptions options;
    options.retry = false;

    std::atomic<int> slow_runs{ 0 };
    std::atomic<int> fast_runs{ 0 };

    RequestResult slow = coordinator.execute(
    "slow:1",
    [&slow_runs]
    {
        slow_runs++;
        std::this_thread::sleep_for(300ms);
        return text("late");
    },
    options);
    REQUIRE(slow.status == GovernorStatus::TIMEOUT);

    // The only worker is still busy with the abandoned attempt
    auto start = std::chrono::steady_clock::now();
    RequestResult fast = coordinator.execute(
    "fast:1",
    [&fast_runs]
    {
        fast_runs++;
        return text("quick");
    },
    options);
    auto elapsed = std::chrono::steady_clock::now() - start;

    REQUIRE(fast.ok());
    REQUIRE(fast.value == text("quick"));
    REQUIRE(fast_runs == 1);
    REQUIRE(elapsed >= 100ms);

    std::this_thread::sleep_for(100ms);
    REQUIRE(slow_runs == 1);
}

TEST_CASE("RequestCoordinator - timeout applies per attempt", "[request]")
{
    CacheStore cache(roomyCache());
    RequestConfig config = fastRequests();
    config.timeout_ms = 100;
    config.max_attempts = 2;
    RequestCoordinator coordinator(cache, config);
    std::atomic<int> calls{ 0 };

    auto start = std::chrono::steady_clock::now();
    RequestResult result = coordinator.execute("feed:slow-start",
                                               [&calls]
                                               {
                                                   if (++calls == 1)
                                                   {
                                                       std::this_thread::sleep_for(250ms);
                                                       return text("too late");
                                                   }
                                                   std::this_thread::sleep_for(60ms);
                                                   return text("second");
                                               });
    auto elapsed = std::chrono::steady_clock::now() - start;

    REQUIRE(result.ok());
    REQUIRE(result.value == text("second"));
    REQUIRE(calls == 2);
    // Longer than a single timeout, yet each attempt stayed inside its own
    REQUIRE(elapsed > 100ms);
}

TEST_CASE("RequestCoordinator - retry with backoff", "[request]")
{
    CacheStore cache(roomyCache());
    RequestCoordinator coordinator(cache, fastRequests());
    std::atomic<int> calls{ 0 };

    auto flaky = [&calls]
    {
        if (++calls < 3)
        {
            throw std::runtime_error("attempt " + std::to_string(calls.load()) + " failed");
        }
        return text("third time");
    };

    SECTION("Succeeds on the last allowed attempt")
    {
        auto start = std::chrono::steady_clock::now();
        RequestResult result = coordinator.execute("flaky:1", flaky);
        auto elapsed = std::chrono::steady_clock::now() - start;

        REQUIRE(result.ok());
        REQUIRE(result.value == text("third time"));
        REQUIRE(calls == 3);
        // 10 ms then 20 ms of backoff
        REQUIRE(elapsed >= 30ms);
    }

    SECTION("Without retry the first failure is final")
    {
        RequestOptions options;
        options.retry = false;

        RequestResult result = coordinator.execute("flaky:1", flaky, options);

        REQUIRE(result.status == GovernorStatus::WORK_FAILED);
        REQUIRE(result.error_message == "attempt 1 failed");
        REQUIRE(calls == 1);
    }

    SECTION("Exhausted retries report the last error")
    {
        RequestResult result = coordinator.execute("flaky:2",
                                                   [&calls]() -> Payload
                                                   {
                                                       throw std::runtime_error("failure " + std::to_string(++calls));
                                                   });

        REQUIRE(result.status == GovernorStatus::WORK_FAILED);
        REQUIRE(result.error_message == "failure 3");
    }
}

TEST_CASE("RequestCoordinator - rate limiting", "[request][ratelimit]")
{
    ManualClock clock;
    CacheStore cache(roomyCache());
    RequestConfig config = fastRequests();
    config.rate_limit.max_requests = 3;
    config.rate_limit.window_ms = 1000;
    RequestCoordinator coordinator(cache, config, clock.source());

    auto work = []
    {
        return text("ok");
    };

    for (int i = 0; i < 3; ++i)
    {
        REQUIRE(coordinator.execute("search:q" + std::to_string(i), work).ok());
    }

    SECTION("Call max+1 in the window is refused")
    {
        RequestResult refused = coordinator.execute("search:q3", work);
        REQUIRE(refused.status == GovernorStatus::RATE_LIMIT_EXCEEDED);

        SECTION("and succeeds after the window elapses")
        {
            clock.advance(Milliseconds(1000));
            REQUIRE(coordinator.execute("search:q3", work).ok());
        }
    }

    SECTION("Cache hits do not count against the limit")
    {
        REQUIRE(coordinator.execute("search:q0", work).ok());
        REQUIRE(coordinator.execute("search:q1", work).ok());
    }

    SECTION("Other classes are unaffected")
    {
        REQUIRE(coordinator.execute("profile:me", work).ok());
    }

    SECTION("Pruning drops elapsed windows")
    {
        clock.advance(Milliseconds(5000));
        REQUIRE(coordinator.pruneRateLimitWindows() == 1);
    }
}

TEST_CASE("RequestCoordinator - batch", "[request]")
{
    CacheStore cache(roomyCache());
    RequestCoordinator coordinator(cache, fastRequests());

    SECTION("Results keep input order, not completion order")
    {
        std::vector<WorkFn> work = {
            []
            {
                std::this_thread::sleep_for(150ms);
                return text("r1");
            },
            []
            {
                return text("r2");
            },
            []
            {
                return text("r3");
            },
        };

        auto results = coordinator.executeBatch(std::move(work));

        REQUIRE(results.size() == 3);
        REQUIRE(results[0].value == text("r1"));
        REQUIRE(results[1].value == text("r2"));
        REQUIRE(results[2].value == text("r3"));
    }

    SECTION("No more than max_concurrent run at once")
    {
        std::atomic<int> running{ 0 };
        std::atomic<int> peak{ 0 };
        std::vector<WorkFn> work;

        for (int i = 0; i < 8; ++i)
        {
            work.push_back(
            [&running, &peak, i]
            {
                int now = ++running;
                int seen = peak.load();
                while (now > seen && !peak.compare_exchange_weak(seen, now))
                {
                }
                std::this_thread::sleep_for(20ms);
                running--;
                return Payload{ static_cast<uint8_t>(i) };
            });
        }

        auto results = coordinator.executeBatch(std::move(work));

        REQUIRE(results.size() == 8);
        REQUIRE(peak <= 2);
        for (size_t i = 0; i < results.size(); ++i)
        {
            REQUIRE(results[i].value == Payload{ static_cast<uint8_t>(i) });
        }
    }

    SECTION("A failing item does not disturb the others")
    {
        std::vector<WorkFn> work = {
            []
            {
                return text("a");
            },
            []() -> Payload
            {
                throw std::runtime_error("bad item");
            },
            []
            {
                return text("c");
            },
        };

        auto results = coordinator.executeBatch(std::move(work));

        REQUIRE(results[0].ok());
        REQUIRE(results[1].status == GovernorStatus::WORK_FAILED);
        REQUIRE(results[1].error_message == "bad item");
        REQUIRE(results[2].ok());
    }

    SECTION("Empty batch")
    {
        REQUIRE(coordinator.executeBatch({}).empty());
    }
}

TEST_CASE("RequestCoordinator - shutdown", "[request]")
{
    CacheStore cache(roomyCache());
    RequestCoordinator coordinator(cache, fastRequests());

    coordinator.shutdown();

    RequestResult result = coordinator.execute("feed:1",
                                               []
                                               {
                                                   return text("never");
                                               });
    REQUIRE(result.status == GovernorStatus::SHUTTING_DOWN);

    auto batch = coordinator.executeBatch({ []
                                            {
                                                return text("never");
                                            } });
    REQUIRE(batch[0].status == GovernorStatus::SHUTTING_DOWN);
}

TEST_CASE("WorkerPool - priority order", "[request]")
{
    WorkerPool pool(1);

    std::promise<void> release;
    std::shared_future<void> released = release.get_future().share();
    std::atomic<bool> blocker_running{ false };

    REQUIRE(pool.submit(RequestPriority::HIGH,
                        [released, &blocker_running]
                        {
                            blocker_running = true;
                            released.wait();
                        }));

    while (!blocker_running)
    {
        std::this_thread::sleep_for(1ms);
    }

    std::mutex order_mutex;
    std::vector<std::string> order;
    auto record = [&order_mutex, &order](std::string name)
    {
        return [&order_mutex, &order, name]
        {
            std::lock_guard<std::mutex> lock(order_mutex);
            order.push_back(name);
        };
    };

    REQUIRE(pool.submit(RequestPriority::LOW, record("low")));
    REQUIRE(pool.submit(RequestPriority::HIGH, record("high-1")));
    REQUIRE(pool.submit(RequestPriority::MEDIUM, record("medium")));
    REQUIRE(pool.submit(RequestPriority::HIGH, record("high-2")));
    REQUIRE(pool.getPendingCount() == 4);

    release.set_value();

    auto deadline = std::chrono::steady_clock::now() + 2s;
    while (pool.getPendingCount() > 0 || pool.getActiveCount() > 0)
    {
        REQUIRE(std::chrono::steady_clock::now() < deadline);
        std::this_thread::sleep_for(1ms);
    }

    std::lock_guard<std::mutex> lock(order_mutex);
    REQUIRE(order == std::vector<std::string>{ "high-1", "high-2", "medium", "low" });
}
