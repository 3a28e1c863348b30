#include "../include/adaptive-governor/request_coordinator.hpp"
#include "../include/adaptive-governor/logger.hpp"
#include "../include/adaptive-governor/metrics_collector.hpp"
#include <algorithm>
#include <chrono>
#include <memory>

namespace AdaptiveGovernor
{

namespace
{

std::string failureReason(GovernorStatus status)
{
    switch (status)
    {
    case GovernorStatus::TIMEOUT:
        return "timeout";
    case GovernorStatus::WORK_FAILED:
        return "work_failed";
    case GovernorStatus::RATE_LIMIT_EXCEEDED:
        return "rate_limited";
    case GovernorStatus::SHUTTING_DOWN:
        return "shutting_down";
    default:
        return "other";
    }
}

// Runs on a pool thread; the work function reports failure by throwing
RequestResult invokeWork(const WorkFn &work)
{
    try
    {
        return RequestResult::success(work());
    }
    catch (const std::exception &e)
    {
        return RequestResult::failure(GovernorStatus::WORK_FAILED, e.what());
    }
    catch (...)
    {
        return RequestResult::failure(GovernorStatus::WORK_FAILED, "unknown exception");
    }
}

} // namespace

RequestCoordinator::RequestCoordinator(CacheStore &cache, const RequestConfig &config, TimeSource time_source)
: cache(cache), config(config), rate_limiter(config.rate_limit, std::move(time_source)),
  pool(std::max(config.worker_threads, config.max_concurrent))
{
    Logger::debug(LogCategory::REQUEST, "Coordinator ready: timeout {} ms, {} attempts, {} workers", config.timeout_ms,
                  config.max_attempts, std::max(config.worker_threads, config.max_concurrent));
}

RequestCoordinator::~RequestCoordinator()
{
    shutdown();
}

RequestOptions RequestCoordinator::defaultOptions() const
{
    RequestOptions options;
    options.cache_ttl = Milliseconds(config.default_cache_ttl_ms);
    return options;
}

RequestResult RequestCoordinator::execute(const std::string &key, WorkFn work, const RequestOptions &options)
{
    if (shutdown_requested)
    {
        return RequestResult::failure(GovernorStatus::SHUTTING_DOWN, "coordinator is shutting down");
    }

    if (options.use_cache)
    {
        if (auto cached = cache.get(key))
        {
            Logger::trace(LogCategory::REQUEST, "Cache hit for {}", key);
            return RequestResult::success(std::move(*cached));
        }
    }

    const std::string action_class = RateLimiter::actionClassOf(key);
    if (!rate_limiter.tryAcquire(action_class))
    {
        Logger::warn(LogCategory::RATE_LIMIT, "Rate limit exceeded for {} (class {})", key, action_class);
        GlobalMetrics::instance().recordRequestFailed(failureReason(GovernorStatus::RATE_LIMIT_EXCEEDED));
        return RequestResult::failure(GovernorStatus::RATE_LIMIT_EXCEEDED, "rate limit exceeded for " + action_class);
    }

    std::promise<RequestResult> promise;
    std::shared_future<RequestResult> joined;

    {
        std::lock_guard<std::mutex> lock(in_flight_mutex);

        auto it = in_flight.find(key);
        if (it != in_flight.end())
        {
            joined = it->second;
        }
        else
        {
            in_flight.emplace(key, promise.get_future().share());
            GlobalMetrics::instance().updateInFlightRequests(in_flight.size());
        }
    }

    if (joined.valid())
    {
        Logger::debug(LogCategory::REQUEST, "Joining in-flight execution for {}", key);
        GlobalMetrics::instance().recordSingleFlightJoin();
        return joined.get();
    }

    GlobalMetrics::instance().recordRequestStarted(priorityToString(options.priority));
    auto start_time = std::chrono::steady_clock::now();

    RequestResult result = runWithRetry(key, work, options);

    auto duration = std::chrono::duration<double>(std::chrono::steady_clock::now() - start_time);
    if (result.ok())
    {
        GlobalMetrics::instance().recordRequestCompleted(duration.count());
    }
    else
    {
        Logger::warn(LogCategory::REQUEST, "Request {} failed with {}: {}", key, statusToString(result.status),
                     result.error_message);
        GlobalMetrics::instance().recordRequestFailed(failureReason(result.status));
    }

    settle(key, result, options);
    promise.set_value(result);

    return result;
}

void RequestCoordinator::settle(const std::string &key, const RequestResult &result, const RequestOptions &options)
{
    {
        std::lock_guard<std::mutex> lock(in_flight_mutex);
        in_flight.erase(key);
        GlobalMetrics::instance().updateInFlightRequests(in_flight.size());
    }

    if (!result.ok() || !options.use_cache)
    {
        return;
    }

    // The value is already in hand, a failed write only costs the next caller a miss
    GovernorStatus status = cache.put(key, result.value, options.cache_ttl);
    if (status != GovernorStatus::SUCCESS)
    {
        Logger::warn(LogCategory::REQUEST, "{} caching result of {}: {}",
                     statusToString(GovernorStatus::CACHE_WRITE_FAILED), key, statusToString(status));
        GlobalMetrics::instance().recordRequestFailed("cache_write");
    }
}

RequestResult RequestCoordinator::runWithRetry(const std::string &key, const WorkFn &work, const RequestOptions &options)
{
    const uint32_t attempts =
    options.retry ? std::clamp<uint32_t>(config.max_attempts, 1, RequestConfig::MAX_ATTEMPTS_LIMIT) : 1;
    const Milliseconds timeout(config.timeout_ms);

    RequestResult result;
    for (uint32_t attempt = 1; attempt <= attempts; ++attempt)
    {
        auto state = submitAttempt(work, options.priority);
        result = awaitAttempt(*state, timeout);

        if (result.status == GovernorStatus::TIMEOUT)
        {
            Logger::warn(LogCategory::REQUEST, "Attempt {}/{} for {} timed out after {} ms", attempt, attempts, key,
                         config.timeout_ms);
        }

        if (result.ok() || result.status == GovernorStatus::SHUTTING_DOWN)
        {
            return result;
        }

        if (attempt == attempts)
        {
            break;
        }

        Milliseconds delay(static_cast<int64_t>(config.backoff_base_ms) << (attempt - 1));
        Logger::info(LogCategory::REQUEST, "Retrying {} in {} ms after {} ({})", key, delay.count(),
                     statusToString(result.status), result.error_message);
        GlobalMetrics::instance().recordRequestRetry();

        if (!waitBackoff(delay))
        {
            return RequestResult::failure(GovernorStatus::SHUTTING_DOWN, "coordinator is shutting down");
        }
    }

    return result;
}

std::shared_ptr<RequestCoordinator::AttemptState> RequestCoordinator::submitAttempt(const WorkFn &work,
                                                                                   RequestPriority priority)
{
    auto state = std::make_shared<AttemptState>();

    auto resolve = [state](RequestResult result)
    {
        {
            std::lock_guard<std::mutex> lock(state->mutex);
            state->result = std::move(result);
        }
        state->condition.notify_all();
    };

    bool accepted = pool.submit(
    priority,
    [state, work, resolve]
    {
        {
            std::lock_guard<std::mutex> lock(state->mutex);
            state->started = true;
        }
        state->condition.notify_all();

        resolve(invokeWork(work));
    },
    [resolve]
    {
        resolve(RequestResult::failure(GovernorStatus::SHUTTING_DOWN, "cancelled by shutdown"));
    });

    if (!accepted)
    {
        resolve(RequestResult::failure(GovernorStatus::SHUTTING_DOWN, "coordinator is shutting down"));
    }

    return state;
}

RequestResult RequestCoordinator::awaitAttempt(AttemptState &attempt, std::optional<Milliseconds> timeout)
{
    std::unique_lock<std::mutex> lock(attempt.mutex);

    // Queue time is not part of the attempt; shutdown cancels queued jobs
    attempt.condition.wait(lock,
                           [&attempt]
                           {
                               return attempt.started || attempt.result.has_value();
                           });

    if (!timeout)
    {
        attempt.condition.wait(lock,
                               [&attempt]
                               {
                                   return attempt.result.has_value();
                               });
        return *attempt.result;
    }

    if (!attempt.condition.wait_for(lock, *timeout,
                                    [&attempt]
                                    {
                                        return attempt.result.has_value();
                                    }))
    {
        return RequestResult::failure(GovernorStatus::TIMEOUT, fmt::format("timed out after {} ms", timeout->count()));
    }

    return *attempt.result;
}

bool RequestCoordinator::waitBackoff(Milliseconds delay)
{
    std::unique_lock<std::mutex> lock(backoff_mutex);
    return !backoff_condition.wait_for(lock, delay,
                                       [this]
                                       {
                                           return shutdown_requested.load();
                                       });
}

std::vector<RequestResult> RequestCoordinator::executeBatch(std::vector<WorkFn> work, RequestPriority priority)
{
    std::vector<RequestResult> results(work.size());
    std::vector<std::shared_ptr<AttemptState>> outcomes(work.size());
    const size_t window = std::max<size_t>(1, config.max_concurrent);

    size_t next = 0;
    auto launch = [&]
    {
        outcomes[next] = submitAttempt(work[next], priority);
        next++;
    };

    while (next < work.size() && next < window)
    {
        launch();
    }

    // Waiting in input order frees a slot only once the oldest item settles
    for (size_t i = 0; i < work.size(); ++i)
    {
        results[i] = awaitAttempt(*outcomes[i], std::nullopt);
        if (!results[i].ok())
        {
            Logger::debug(LogCategory::REQUEST, "Batch item {} failed with {}: {}", i, statusToString(results[i].status),
                          results[i].error_message);
        }

        if (next < work.size())
        {
            launch();
        }
    }

    return results;
}

size_t RequestCoordinator::activeRequests() const
{
    std::lock_guard<std::mutex> lock(in_flight_mutex);
    return in_flight.size();
}

size_t RequestCoordinator::pruneRateLimitWindows()
{
    return rate_limiter.prune();
}

void RequestCoordinator::shutdown()
{
    {
        std::lock_guard<std::mutex> lock(backoff_mutex);
        if (shutdown_requested)
        {
            return;
        }
        shutdown_requested = true;
    }

    Logger::info(LogCategory::REQUEST, "Shutting down coordinator ({} in flight)", activeRequests());
    backoff_condition.notify_all();
    pool.shutdown();
}

} // namespace AdaptiveGovernor
