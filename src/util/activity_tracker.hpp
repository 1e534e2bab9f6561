#ifndef FLIGHTCACHE_ACTIVITY_TRACKER_HPP
#define FLIGHTCACHE_ACTIVITY_TRACKER_HPP

#include <condition_variable>
#include <cstddef>
#include <mutex>

namespace flightcache {

/**
 * @brief Counts jobs outstanding across a set of queues
 *
 * A job that schedules follow-up work increments the count before it
 * decrements its own, so the count only reaches zero when every queue
 * sharing the tracker has drained.
 */
class ActivityTracker {
public:
    void begin() {
        std::lock_guard<std::mutex> lock(mutex_);
        ++outstanding_;
    }

    void end() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (outstanding_ > 0 && --outstanding_ == 0) {
            idle_cv_.notify_all();
        }
    }

    void wait_idle() {
        std::unique_lock<std::mutex> lock(mutex_);
        idle_cv_.wait(lock, [this] { return outstanding_ == 0; });
    }

    size_t outstanding() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return outstanding_;
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable idle_cv_;
    size_t outstanding_ = 0;
};

} // namespace flightcache

#endif // FLIGHTCACHE_ACTIVITY_TRACKER_HPP
