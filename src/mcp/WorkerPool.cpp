#include "WorkerPool.hpp"
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace toolrpc {

WorkerPool::WorkerPool(std::size_t thread_count) {
    if (thread_count == 0) {
        throw std::invalid_argument("Worker pool needs at least one thread");
    }

    threads_.reserve(thread_count);
    for (std::size_t i = 0; i < thread_count; ++i) {
        threads_.emplace_back([this]() { worker_loop(); });
    }
    spdlog::debug("WorkerPool started with {} threads", thread_count);
}

WorkerPool::~WorkerPool() {
    shutdown();
    for (auto& thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
}

bool WorkerPool::submit(Job job) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            return false;
        }
        jobs_.push(std::move(job));
    }
    job_available_.notify_one();
    return true;
}

void WorkerPool::wait_idle() {
    std::unique_lock<std::mutex> lock(mutex_);
    idle_.wait(lock, [this]() { return jobs_.empty() && active_ == 0; });
}

std::size_t WorkerPool::shutdown() {
    std::size_t abandoned = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
        abandoned = jobs_.size();
        std::queue<Job>().swap(jobs_);
    }
    job_available_.notify_all();
    idle_.notify_all();

    if (abandoned > 0) {
        spdlog::info("WorkerPool abandoned {} queued jobs", abandoned);
    }
    return abandoned;
}

void WorkerPool::worker_loop() {
    while (true) {
        Job job;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            job_available_.wait(lock, [this]() { return stopping_ || !jobs_.empty(); });
            if (jobs_.empty()) {
                return;  // stopping and nothing left
            }
            job = std::move(jobs_.front());
            jobs_.pop();
            ++active_;
        }

        try {
            job();
        } catch (const std::exception& e) {
            spdlog::error("Worker job failed: {}", e.what());
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            --active_;
        }
        idle_.notify_all();
    }
}

} // namespace toolrpc
