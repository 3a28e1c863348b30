#pragma once

#include "../types/request_types.hpp"
#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace AdaptiveGovernor
{

struct PoolJob
{
    RequestPriority priority = RequestPriority::MEDIUM;
    uint64_t sequence = 0;
    std::function<void()> run{};

    // Invoked instead of run when the pool shuts down before the job starts
    std::function<void()> cancel{};
};

// Fixed set of threads draining a priority queue: High before Medium before
// Low, FIFO within a priority.
class WorkerPool
{
    public:
    explicit WorkerPool(size_t thread_count = 4);
    ~WorkerPool();

    WorkerPool(const WorkerPool &) = delete;
    WorkerPool &operator=(const WorkerPool &) = delete;

    // false once shutdown has started; the job is not run or cancelled then
    bool submit(RequestPriority priority, std::function<void()> run, std::function<void()> cancel = {});

    // Cancels queued jobs and joins workers after the running ones finish
    void shutdown();

    size_t getPendingCount() const;
    size_t getActiveCount() const;

    private:
    struct JobOrder
    {
        bool operator()(const PoolJob &a, const PoolJob &b) const
        {
            if (a.priority != b.priority)
            {
                return a.priority > b.priority;
            }
            return a.sequence > b.sequence;
        }
    };

    void workerThread();

    std::vector<std::thread> worker_threads{};
    std::priority_queue<PoolJob, std::vector<PoolJob>, JobOrder> job_queue;
    uint64_t next_sequence = 0;

    mutable std::mutex queue_mutex{};
    std::condition_variable queue_condition{};
    std::atomic<bool> shutdown_requested{};

    std::atomic<size_t> active_count{};
};

} // namespace AdaptiveGovernor
