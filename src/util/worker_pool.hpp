/**
 * @file worker_pool.hpp
 * @brief Fixed-size thread pool for network, disk and transform work
 */

#ifndef FLIGHTCACHE_WORKER_POOL_HPP
#define FLIGHTCACHE_WORKER_POOL_HPP

#include "util/activity_tracker.hpp"
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

namespace flightcache {

class WorkerPool {
public:
    using Job = std::function<void()>;

    /**
     * @param thread_count Number of worker threads (at least one is started)
     * @param tracker Optional tracker shared with the callback queue
     */
    explicit WorkerPool(size_t thread_count, std::shared_ptr<ActivityTracker> tracker = nullptr);

    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    /**
     * @brief Queue a job for any worker
     * @return false if the pool has been shut down and the job was dropped
     */
    bool submit(Job job);

    /**
     * @brief Stop accepting work, drop queued jobs, join the workers
     *
     * Jobs already running are allowed to finish.
     */
    void shutdown();

    /**
     * @brief Block until no job is queued or running
     */
    void wait_idle();

    size_t thread_count() const { return workers_.size(); }

private:
    void worker_loop();

    std::shared_ptr<ActivityTracker> tracker_;

    std::mutex mutex_;
    std::condition_variable queue_cv_;
    std::condition_variable idle_cv_;
    std::deque<Job> jobs_;
    size_t active_jobs_ = 0;
    bool stopping_ = false;

    std::vector<std::thread> workers_;
};

} // namespace flightcache

#endif // FLIGHTCACHE_WORKER_POOL_HPP
