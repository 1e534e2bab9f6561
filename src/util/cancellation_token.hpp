#ifndef FLIGHTCACHE_CANCELLATION_TOKEN_HPP
#define FLIGHTCACHE_CANCELLATION_TOKEN_HPP

#include <atomic>
#include <memory>

namespace flightcache {

/**
 * @brief Cooperative cancellation flag shared between a task's cancel handle and its work
 *
 * Cancellation is advisory: work that is already past its last check runs to
 * completion and its result is discarded by the registry.
 */
class CancellationToken {
public:
    void cancel() { cancelled_.store(true, std::memory_order_release); }

    bool is_cancelled() const { return cancelled_.load(std::memory_order_acquire); }

private:
    std::atomic<bool> cancelled_{false};
};

using CancellationTokenPtr = std::shared_ptr<CancellationToken>;

} // namespace flightcache

#endif // FLIGHTCACHE_CANCELLATION_TOKEN_HPP
