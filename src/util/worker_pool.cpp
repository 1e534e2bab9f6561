#include "util/worker_pool.hpp"
#include "util/logger.hpp"
#include <exception>

namespace flightcache {

WorkerPool::WorkerPool(size_t thread_count, std::shared_ptr<ActivityTracker> tracker)
    : tracker_(std::move(tracker))
{
    if (thread_count == 0) {
        thread_count = 1;
    }
    workers_.reserve(thread_count);
    for (size_t i = 0; i < thread_count; ++i) {
        workers_.emplace_back([this] { worker_loop(); });
    }
}

WorkerPool::~WorkerPool() {
    shutdown();
}

bool WorkerPool::submit(Job job) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            return false;
        }
        if (tracker_) {
            tracker_->begin();
        }
        jobs_.push_back(std::move(job));
    }
    queue_cv_.notify_one();
    return true;
}

void WorkerPool::shutdown() {
    std::deque<Job> dropped;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
        dropped.swap(jobs_);
    }
    queue_cv_.notify_all();

    for (auto& worker : workers_) {
        if (worker.joinable() && worker.get_id() != std::this_thread::get_id()) {
            worker.join();
        }
    }

    if (tracker_) {
        for (size_t i = 0; i < dropped.size(); ++i) {
            tracker_->end();
        }
    }
    idle_cv_.notify_all();
}

void WorkerPool::wait_idle() {
    std::unique_lock<std::mutex> lock(mutex_);
    idle_cv_.wait(lock, [this] { return jobs_.empty() && active_jobs_ == 0; });
}

void WorkerPool::worker_loop() {
    for (;;) {
        Job job;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            queue_cv_.wait(lock, [this] { return stopping_ || !jobs_.empty(); });
            if (stopping_) {
                return;
            }
            job = std::move(jobs_.front());
            jobs_.pop_front();
            ++active_jobs_;
        }

        try {
            job();
        } catch (const std::exception& e) {
            Logger::get_instance().log_error(CacheEventContext("", "", "worker"),
                                             std::string("Worker job threw: ") + e.what());
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            --active_jobs_;
            if (jobs_.empty() && active_jobs_ == 0) {
                idle_cv_.notify_all();
            }
        }
        if (tracker_) {
            tracker_->end();
        }
    }
}

} // namespace flightcache
