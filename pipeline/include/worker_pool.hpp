#pragma once

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <thread>
#include <vector>

namespace pipeline {

    // Fixed set of threads draining a FIFO job queue. The destructor lets
    // queued jobs finish, then joins every thread.
    class WorkerPool {
    public:
        using Job = std::function<void()>;

        explicit WorkerPool(std::size_t thread_count);
        ~WorkerPool();

        WorkerPool(const WorkerPool&) = delete;
        WorkerPool& operator=(const WorkerPool&) = delete;

        // Jobs must not throw; the pool logs and drops anything that escapes.
        // Throws InternalException once shutdown has begun.
        void enqueue(Job job);

        // Refuses new jobs, lets queued ones finish and joins the threads.
        // Idempotent; must not be called from inside a job.
        void shutdown();

        std::size_t pendingJobs() const;
        std::size_t threadCount() const { return threads_.size(); }

    private:
        void workerLoop(std::size_t index);

        mutable std::mutex mutex_;
        std::condition_variable cv_;
        std::deque<Job> jobs_;
        bool stopping_ = false;
        std::vector<std::thread> threads_;
    };

} // namespace pipeline
