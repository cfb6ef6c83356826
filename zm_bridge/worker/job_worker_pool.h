#ifndef JOB_WORKER_POOL_H
#define JOB_WORKER_POOL_H

// Standard Library
#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

/**
 * @brief Fixed number of worker threads draining a bounded job queue.
 *
 * Keeps ffmpeg runs off the broker client's callback thread and caps how many
 * run at once.
 */
class JobWorkerPool
{
public:
    using Job = std::function<void()>;

    /**
     * @brief Constructs the pool. No thread runs before start().
     * @param Number of worker threads, at least 1.
     * @param Maximum number of queued jobs, at least 1.
     */
    JobWorkerPool(std::size_t worker_count, std::size_t queue_capacity);

    /**
     * @brief Stops the workers.
     */
    ~JobWorkerPool();

    JobWorkerPool(const JobWorkerPool&) = delete;
    JobWorkerPool& operator=(const JobWorkerPool&) = delete;

    /**
     * @brief Starts the worker threads.
     */
    void start();

    /**
     * @brief Refuses new jobs, lets the workers finish the queued ones and joins them.
     */
    void stop();

    /**
     * @brief Queues a job without blocking.
     * @param Job to run on a worker thread.
     * @return false when the queue is full or the pool is not running.
     */
    bool trySubmit(Job job);

    std::size_t queuedJobs() const;
    std::size_t capacity() const { return queue_capacity; }

private:
    /**
     * @brief Loop executed by every worker thread.
     */
    void workerLoop();

    // === Members ===
    std::size_t worker_count;
    std::size_t queue_capacity;

    std::queue<Job> queue;
    mutable std::mutex mutex;
    std::condition_variable cv;
    std::vector<std::thread> workers;

    std::atomic<bool> running;
};

#endif // JOB_WORKER_POOL_H
