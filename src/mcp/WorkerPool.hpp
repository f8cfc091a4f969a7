#pragma once

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace toolrpc {

/**
 * @brief Fixed set of threads draining a FIFO job queue
 *
 * Used by Session to dispatch frames concurrently. Jobs must not throw;
 * an escaping exception is logged and the worker keeps running.
 */
class WorkerPool {
public:
    using Job = std::function<void()>;

    /**
     * @brief Start worker threads
     * @param thread_count Number of threads (must be at least 1)
     */
    explicit WorkerPool(std::size_t thread_count);

    /**
     * @brief Stops the pool, abandoning queued jobs, and joins the threads
     */
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /**
     * @brief Queue a job
     * @return false if the pool is shutting down and the job was not queued
     */
    bool submit(Job job);

    /**
     * @brief Block until every queued and running job has finished
     */
    void wait_idle();

    /**
     * @brief Stop accepting jobs and drop the ones not yet started
     * @return Number of abandoned jobs
     */
    std::size_t shutdown();

    std::size_t thread_count() const { return threads_.size(); }

private:
    void worker_loop();

    std::vector<std::thread> threads_;
    std::queue<Job> jobs_;
    std::mutex mutex_;
    std::condition_variable job_available_;
    std::condition_variable idle_;
    std::size_t active_ = 0;
    bool stopping_ = false;
};

} // namespace toolrpc
