/**
 * @file dispatch_queue.hpp
 * @brief Serial callback queue backed by a single dedicated thread
 *
 * Every result delivery of the cache runs on one DispatchQueue, so callers get
 * a single-threaded view of their own state no matter which worker produced
 * the result.
 */

#ifndef FLIGHTCACHE_DISPATCH_QUEUE_HPP
#define FLIGHTCACHE_DISPATCH_QUEUE_HPP

#include "util/activity_tracker.hpp"
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace flightcache {

class DispatchQueue {
public:
    using Job = std::function<void()>;

    /**
     * @param name Queue label used in log messages
     * @param tracker Optional tracker shared with other queues for idle detection
     */
    explicit DispatchQueue(std::string name = "flightcache.callbacks",
                           std::shared_ptr<ActivityTracker> tracker = nullptr);

    /**
     * @brief Drains pending jobs and joins the queue thread
     *
     * Must not run on the queue's own thread.
     */
    ~DispatchQueue();

    DispatchQueue(const DispatchQueue&) = delete;
    DispatchQueue& operator=(const DispatchQueue&) = delete;

    /**
     * @brief Enqueue a job; jobs run one at a time in FIFO order
     * @return false if the queue has been shut down and the job was dropped
     */
    bool post(Job job);

    /**
     * @brief Stop accepting jobs, run what is already queued, join the thread
     */
    void shutdown();

    /**
     * @brief Block until the queue is empty and no job is running
     */
    void wait_idle();

    bool is_current() const { return std::this_thread::get_id() == thread_id_; }

    std::thread::id thread_id() const { return thread_id_; }

    const std::string& name() const { return name_; }

private:
    void run();

    std::string name_;
    std::shared_ptr<ActivityTracker> tracker_;

    std::mutex mutex_;
    std::condition_variable queue_cv_;
    std::condition_variable idle_cv_;
    std::deque<Job> jobs_;
    bool running_job_ = false;
    bool stopping_ = false;

    std::thread thread_;
    std::thread::id thread_id_;
};

} // namespace flightcache

#endif // FLIGHTCACHE_DISPATCH_QUEUE_HPP
