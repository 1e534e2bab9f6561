/**
 * @file notification_center.hpp
 * @brief Fire-and-forget lifecycle signals (memory pressure, entering background)
 *
 * The embedding application posts signals; cache components observe them to
 * drop memory or trim disk storage. Observers are bound to an owner through a
 * non-owning handle: once the owner is gone the observation is dropped on the
 * next post instead of calling into a dead object.
 */

#ifndef FLIGHTCACHE_NOTIFICATION_CENTER_HPP
#define FLIGHTCACHE_NOTIFICATION_CENTER_HPP

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace flightcache {

enum class LifecycleSignal {
    MemoryPressure,
    EnteredBackground
};

std::string signal_to_string(LifecycleSignal signal);

class NotificationCenter {
public:
    using ObserverId = uint64_t;
    using Callback = std::function<void(LifecycleSignal)>;

    NotificationCenter() = default;

    NotificationCenter(const NotificationCenter&) = delete;
    NotificationCenter& operator=(const NotificationCenter&) = delete;

    /**
     * @brief Process-wide center used when none is injected
     */
    static NotificationCenter& default_center();

    /**
     * @brief Observe a signal for as long as @p owner is alive
     *
     * @param signal Signal to observe
     * @param owner Liveness handle; the observation lapses once it expires
     * @param callback Invoked on the posting thread
     * @return Identifier for remove_observer()
     */
    ObserverId add_observer(LifecycleSignal signal, std::weak_ptr<void> owner, Callback callback);

    /**
     * @brief Remove an observation; unknown ids are ignored
     */
    void remove_observer(ObserverId id);

    /**
     * @brief Deliver @p signal to every live observer, outside the lock
     * @return Number of observers invoked
     */
    size_t post(LifecycleSignal signal);

    size_t observer_count() const;

private:
    struct Observer {
        LifecycleSignal signal;
        std::weak_ptr<void> owner;
        Callback callback;
    };

    mutable std::mutex mutex_;
    std::map<ObserverId, Observer> observers_;
    ObserverId next_id_ = 1;
};

} // namespace flightcache

#endif // FLIGHTCACHE_NOTIFICATION_CENTER_HPP
