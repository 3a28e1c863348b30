#pragma once

#include "../types/config.hpp"
#include "../types/request_types.hpp"
#include "cache_store.hpp"
#include "rate_limiter.hpp"
#include "worker_pool.hpp"
#include <atomic>
#include <condition_variable>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace AdaptiveGovernor
{

/**
 * Turns a work function into a cached, rate-limited, single-flight call.
 *
 * execute() order: cache lookup, rate limit, in-flight join, then a fresh
 * execution on the worker pool with a per-attempt timeout and exponential
 * backoff between attempts. The attempt timeout starts when a worker picks
 * the attempt up, so time spent queued behind other work does not count.
 * A timed-out attempt is abandoned, not stopped; the work function keeps its
 * worker until it returns.
 */
class RequestCoordinator
{
    public:
    RequestCoordinator(CacheStore &cache, const RequestConfig &config, TimeSource time_source = defaultTimeSource());
    ~RequestCoordinator();

    RequestCoordinator(const RequestCoordinator &) = delete;
    RequestCoordinator &operator=(const RequestCoordinator &) = delete;

    RequestResult execute(const std::string &key, WorkFn work, const RequestOptions &options = {});

    // Sliding window of max_concurrent; results keep input order
    std::vector<RequestResult> executeBatch(std::vector<WorkFn> work, RequestPriority priority = RequestPriority::MEDIUM);

    size_t activeRequests() const;
    size_t pruneRateLimitWindows();

    RequestOptions defaultOptions() const;

    void shutdown();

    private:
    // Shared between the caller and the pool job of one attempt
    struct AttemptState
    {
        std::mutex mutex;
        std::condition_variable condition;
        bool started = false;
        std::optional<RequestResult> result;
    };

    RequestResult runWithRetry(const std::string &key, const WorkFn &work, const RequestOptions &options);
    std::shared_ptr<AttemptState> submitAttempt(const WorkFn &work, RequestPriority priority);
    RequestResult awaitAttempt(AttemptState &attempt, std::optional<Milliseconds> timeout);
    bool waitBackoff(Milliseconds delay);
    void settle(const std::string &key, const RequestResult &result, const RequestOptions &options);

    CacheStore &cache;
    RequestConfig config;
    RateLimiter rate_limiter;
    WorkerPool pool;

    mutable std::mutex in_flight_mutex;
    std::unordered_map<std::string, std::shared_future<RequestResult>> in_flight;

    std::mutex backoff_mutex;
    std::condition_variable backoff_condition;
    std::atomic<bool> shutdown_requested{ false };
};

} // namespace AdaptiveGovernor
