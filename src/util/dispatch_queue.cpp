#include "util/dispatch_queue.hpp"
#include "util/logger.hpp"
#include <exception>

namespace flightcache {

DispatchQueue::DispatchQueue(std::string name, std::shared_ptr<ActivityTracker> tracker)
    : name_(std::move(name))
    , tracker_(std::move(tracker))
{
    thread_ = std::thread([this] { run(); });
    thread_id_ = thread_.get_id();
}

DispatchQueue::~DispatchQueue() {
    shutdown();
}

bool DispatchQueue::post(Job job) {
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

void DispatchQueue::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_ && !thread_.joinable()) {
            return;
        }
        stopping_ = true;
    }
    queue_cv_.notify_all();
    if (thread_.joinable() && !is_current()) {
        thread_.join();
    }
}

void DispatchQueue::wait_idle() {
    std::unique_lock<std::mutex> lock(mutex_);
    idle_cv_.wait(lock, [this] { return jobs_.empty() && !running_job_; });
}

void DispatchQueue::run() {
    for (;;) {
        Job job;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            queue_cv_.wait(lock, [this] { return stopping_ || !jobs_.empty(); });
            if (jobs_.empty()) {
                // stopping_ and fully drained
                idle_cv_.notify_all();
                return;
            }
            job = std::move(jobs_.front());
            jobs_.pop_front();
            running_job_ = true;
        }

        try {
            job();
        } catch (const std::exception& e) {
            Logger::get_instance().log_error(CacheEventContext("", "", name_),
                                             std::string("Callback threw: ") + e.what());
        }

        {
            std::lock_guard<std::mutex> lock(mutex_);
            running_job_ = false;
            if (jobs_.empty()) {
                idle_cv_.notify_all();
            }
        }
        if (tracker_) {
            tracker_->end();
        }
    }
}

} // namespace flightcache
