#include "util/notification_center.hpp"
#include <utility>
#include <vector>

namespace flightcache {

std::string signal_to_string(LifecycleSignal signal) {
    switch (signal) {
        case LifecycleSignal::MemoryPressure: return "memory_pressure";
        case LifecycleSignal::EnteredBackground: return "entered_background";
        default: return "unknown";
    }
}

NotificationCenter& NotificationCenter::default_center() {
    static NotificationCenter center;
    return center;
}

NotificationCenter::ObserverId NotificationCenter::add_observer(
    LifecycleSignal signal,
    std::weak_ptr<void> owner,
    Callback callback)
{
    std::lock_guard<std::mutex> lock(mutex_);
    ObserverId id = next_id_++;
    observers_[id] = Observer{signal, std::move(owner), std::move(callback)};
    return id;
}

void NotificationCenter::remove_observer(ObserverId id) {
    std::lock_guard<std::mutex> lock(mutex_);
    observers_.erase(id);
}

size_t NotificationCenter::post(LifecycleSignal signal) {
    // Each pending delivery pins its owner so it cannot expire mid-callback
    std::vector<std::pair<std::shared_ptr<void>, Callback>> deliveries;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = observers_.begin(); it != observers_.end();) {
            auto owner = it->second.owner.lock();
            if (!owner) {
                it = observers_.erase(it);
                continue;
            }
            if (it->second.signal == signal) {
                deliveries.emplace_back(std::move(owner), it->second.callback);
            }
            ++it;
        }
    }

    for (auto& delivery : deliveries) {
        delivery.second(signal);
    }
    return deliveries.size();
}

size_t NotificationCenter::observer_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return observers_.size();
}

} // namespace flightcache
