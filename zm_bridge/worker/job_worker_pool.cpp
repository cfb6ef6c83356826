// Standard Library
#include <iostream>
#include <utility>

// Project headers
#include "job_worker_pool.h"

// === Constructor ===
JobWorkerPool::JobWorkerPool(std::size_t worker_count, std::size_t queue_capacity)
    : worker_count(worker_count == 0 ? 1 : worker_count),
    queue_capacity(queue_capacity == 0 ? 1 : queue_capacity),
    running(false)
{
}

// === Destructor ===
JobWorkerPool::~JobWorkerPool()
{
    stop();
}

// === Starts the worker threads ===
void JobWorkerPool::start()
{
    std::lock_guard<std::mutex> lock(mutex);
    if (running) return;

    running = true;
    for (std::size_t i = 0; i < worker_count; ++i)
    {
        workers.emplace_back(&JobWorkerPool::workerLoop, this);
    }
    std::cout << "[WORKER] Started " << worker_count << " worker(s), queue capacity " << queue_capacity << std::endl;
}

// === Refuses new jobs, drains the queue and joins the workers ===
void JobWorkerPool::stop()
{
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (!running) return;
        running = false;
    }
    cv.notify_all();

    for (auto& worker : workers)
    {
        if (worker.joinable()) worker.join();
    }
    workers.clear();
    std::cout << "[WORKER] Stopped" << std::endl;
}

// === Queues a job without blocking ===
bool JobWorkerPool::trySubmit(Job job)
{
    {
        std::lock_guard<std::mutex> lock(mutex);
        if (!running || queue.size() >= queue_capacity)
        {
            return false;
        }
        queue.push(std::move(job));
    }
    cv.notify_one();
    return true;
}

std::size_t JobWorkerPool::queuedJobs() const
{
    std::lock_guard<std::mutex> lock(mutex);
    return queue.size();
}

// === Loop executed by every worker thread ===
void JobWorkerPool::workerLoop()
{
    while (true)
    {
        Job job;
        {
            std::unique_lock<std::mutex> lock(mutex);
            cv.wait(lock, [this] {
                return !queue.empty() || !running;
                });

            if (queue.empty())
                break;  // stopped and drained

            job = std::move(queue.front());
            queue.pop();
        }

        try
        {
            job();
        }
        catch (const std::exception& ex)
        {
            std::cerr << "[WORKER ERROR] Job failed: " << ex.what() << std::endl;
        }
    }
}
