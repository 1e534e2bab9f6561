/**
 * @file artifact_paths.hpp
 * @brief Maps cache keys to artifact filenames inside the disk store
 *
 * Every artifact of one locator shares the prefix produced by the unique name
 * function and differs only by the transform's disk suffix.
 */

#ifndef FLIGHTCACHE_ARTIFACT_PATHS_HPP
#define FLIGHTCACHE_ARTIFACT_PATHS_HPP

#include "core/cache_key.hpp"
#include "core/disk_store.hpp"
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>

namespace flightcache {

class ArtifactPaths {
public:
    explicit ArtifactPaths(std::shared_ptr<DiskStore> store,
                           UniqueNameFunction unique_name = default_unique_name)
        : store_(std::move(store)), unique_name_(std::move(unique_name)) {}

    /**
     * @brief Replace the filename function; a null function restores the default
     */
    void set_unique_name_function(UniqueNameFunction unique_name) {
        std::lock_guard<std::mutex> lock(mutex_);
        unique_name_ = unique_name ? std::move(unique_name) : UniqueNameFunction(default_unique_name);
    }

    std::string filename_for(const CacheKey& key) const {
        UniqueNameFunction unique_name;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            unique_name = unique_name_;
        }
        return unique_name(key.locator) + key.transform.disk_suffix();
    }

    std::filesystem::path path_for(const CacheKey& key) const {
        return store_->path_for(filename_for(key));
    }

    std::filesystem::path original_path_for(const std::string& locator) const {
        return path_for(CacheKey(locator, TransformDescriptor::original()));
    }

    DiskStore& store() const { return *store_; }

private:
    std::shared_ptr<DiskStore> store_;
    mutable std::mutex mutex_;
    UniqueNameFunction unique_name_;
};

} // namespace flightcache

#endif // FLIGHTCACHE_ARTIFACT_PATHS_HPP
