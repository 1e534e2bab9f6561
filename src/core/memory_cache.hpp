/**
 * @file memory_cache.hpp
 * @brief Process-local map of fully materialized results
 *
 * Entries are only ever removed all at once (memory pressure, backgrounding,
 * explicit clear). There is no per-entry expiry.
 */

#ifndef FLIGHTCACHE_MEMORY_CACHE_HPP
#define FLIGHTCACHE_MEMORY_CACHE_HPP

#include <atomic>
#include <functional>
#include <mutex>
#include <optional>
#include <unordered_map>

namespace flightcache {

template <typename Key, typename Value, typename Hash = std::hash<Key>>
class MemoryCache {
public:
    MemoryCache() = default;

    MemoryCache(const MemoryCache&) = delete;
    MemoryCache& operator=(const MemoryCache&) = delete;

    std::optional<Value> get(const Key& key) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = items_.find(key);
        if (it == items_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    void set(const Key& key, Value value) {
        std::lock_guard<std::mutex> lock(mutex_);
        items_[key] = std::move(value);
    }

    void remove_all() {
        std::lock_guard<std::mutex> lock(mutex_);
        items_.clear();
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }

    /**
     * @brief When true, the entered-background signal also empties the cache
     */
    bool remove_all_on_background() const { return remove_all_on_background_.load(); }

    void set_remove_all_on_background(bool value) { remove_all_on_background_.store(value); }

private:
    mutable std::mutex mutex_;
    std::unordered_map<Key, Value, Hash> items_;
    std::atomic<bool> remove_all_on_background_{false};
};

} // namespace flightcache

#endif // FLIGHTCACHE_MEMORY_CACHE_HPP
