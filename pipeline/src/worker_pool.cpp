#include "worker_pool.hpp"
#include "exceptions.hpp"
#include "logging.hpp"

#include <utility>

namespace pipeline {

    WorkerPool::WorkerPool(std::size_t thread_count) {
        if (thread_count == 0) {
            throw core::ConfigException("Worker pool needs at least one thread");
        }
        threads_.reserve(thread_count);
        for (std::size_t i = 0; i < thread_count; ++i) {
            threads_.emplace_back(&WorkerPool::workerLoop, this, i);
        }
        core::logging::getLogger()->debug("Worker pool started with {} thread(s)", thread_count);
    }

    WorkerPool::~WorkerPool() {
        shutdown();
    }

    void WorkerPool::shutdown() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stopping_) return;
            stopping_ = true;
        }
        cv_.notify_all();
        for (auto& thread : threads_) {
            if (thread.joinable()) thread.join();
        }
        core::logging::getLogger()->debug("Worker pool stopped");
    }

    void WorkerPool::enqueue(Job job) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stopping_) {
                throw core::InternalException("Worker pool is shutting down");
            }
            jobs_.push_back(std::move(job));
        }
        cv_.notify_one();
    }

    std::size_t WorkerPool::pendingJobs() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return jobs_.size();
    }

    void WorkerPool::workerLoop(std::size_t index) {
        while (true) {
            Job job;
            {
                std::unique_lock<std::mutex> lock(mutex_);
                cv_.wait(lock, [this] { return stopping_ || !jobs_.empty(); });
                // Drain before exiting
                if (jobs_.empty()) return;
                job = std::move(jobs_.front());
                jobs_.pop_front();
            }
            try {
                job();
            } catch (const std::exception& e) {
                core::logging::getLogger()->error("Worker {} job threw: {}", index, e.what());
            }
        }
    }

} // namespace pipeline
