#include "../include/adaptive-governor/worker_pool.hpp"
#include "../include/adaptive-governor/logger.hpp"

namespace AdaptiveGovernor
{

WorkerPool::WorkerPool(size_t thread_count) : shutdown_requested(false), active_count(0)
{
    if (thread_count == 0)
    {
        thread_count = 1;
    }

    for (size_t i = 0; i < thread_count; ++i)
    {
        worker_threads.emplace_back(&WorkerPool::workerThread, this);
    }
}

WorkerPool::~WorkerPool()
{
    shutdown();
}

bool WorkerPool::submit(RequestPriority priority, std::function<void()> run, std::function<void()> cancel)
{
    {
        std::lock_guard<std::mutex> lock(queue_mutex);

        if (shutdown_requested)
        {
            return false;
        }

        job_queue.push(PoolJob{ priority, next_sequence++, std::move(run), std::move(cancel) });
    }

    queue_condition.notify_one();
    return true;
}

void WorkerPool::shutdown()
{
    std::vector<PoolJob> abandoned;

    {
        std::lock_guard<std::mutex> lock(queue_mutex);
        if (shutdown_requested)
        {
            return;
        }
        shutdown_requested = true;

        while (!job_queue.empty())
        {
            abandoned.push_back(job_queue.top());
            job_queue.pop();
        }
    }

    queue_condition.notify_all();

    if (!abandoned.empty())
    {
        Logger::debug(LogCategory::REQUEST, "Cancelling {} queued jobs on shutdown", abandoned.size());
    }

    for (auto &job : abandoned)
    {
        if (job.cancel)
        {
            job.cancel();
        }
    }

    for (auto &thread : worker_threads)
    {
        if (thread.joinable())
        {
            thread.join();
        }
    }

    worker_threads.clear();
}

size_t WorkerPool::getPendingCount() const
{
    std::lock_guard<std::mutex> lock(queue_mutex);
    return job_queue.size();
}

size_t WorkerPool::getActiveCount() const
{
    return active_count.load();
}

void WorkerPool::workerThread()
{
    while (true)
    {
        PoolJob job;

        {
            std::unique_lock<std::mutex> lock(queue_mutex);
            queue_condition.wait(lock,
                                 [this]
                                 {
                                     return !job_queue.empty() || shutdown_requested;
                                 });

            if (shutdown_requested)
            {
                break;
            }

            job = job_queue.top();
            job_queue.pop();
            active_count++;
        }

        job.run();
        active_count--;
    }
}

} // namespace AdaptiveGovernor
