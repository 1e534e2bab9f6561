/**
 * @file content_cache.hpp
 * @brief Two-tier coalescing content cache
 *
 * ContentCache resolves a CacheKey through three tiers:
 * 1. Memory: a hit is delivered synchronously on the calling thread
 * 2. Disk: the derived artifact is read and decoded on a worker
 * 3. Network: a single-flight download per locator followed by a single-flight
 *    transform per key
 *
 * All asynchronous deliveries run on one callback queue. Identical concurrent
 * requests share one download and one transform; cancelling one request never
 * affects the others attached to the same work.
 *
 * Usage Example:
 *   @code
 *   CacheConfig config = parse_cache_config_from_file("flightcache.json");
 *   ContentCache cache(config);
 *
 *   auto mode = cache.fetch("https://x/img", TransformDescriptor::scaled(Size(100, 100)),
 *                           [](const ContentPtr& content) {
 *                               if (content) { ... }
 *                           });
 *   mode.cancel();   // no-op for synchronous hits
 *   @endcode
 */

#ifndef FLIGHTCACHE_CONTENT_CACHE_HPP
#define FLIGHTCACHE_CONTENT_CACHE_HPP

#include "config/cache_config.hpp"
#include "content/raster_codec.hpp"
#include "content/raster_transform.hpp"
#include "core/cache_key.hpp"
#include "core/disk_store.hpp"
#include "core/memory_cache.hpp"
#include "core/single_flight_registry.hpp"
#include "net/fetcher.hpp"
#include "pipeline/artifact_paths.hpp"
#include "pipeline/downloader.hpp"
#include "pipeline/transformer.hpp"
#include "util/activity_tracker.hpp"
#include "util/dispatch_queue.hpp"
#include "util/notification_center.hpp"
#include "util/service_container.hpp"
#include "util/worker_pool.hpp"
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace flightcache {

/**
 * @brief How a fetch() result is delivered
 */
class CallbackMode {
public:
    enum class Kind {
        Sync,   ///< Delivered before fetch() returned
        Async   ///< Will be delivered on the callback queue unless cancelled
    };

    static CallbackMode sync() { return CallbackMode(Kind::Sync, nullptr); }

    static CallbackMode async(std::function<void()> cancel) {
        return CallbackMode(Kind::Async, std::move(cancel));
    }

    Kind kind() const { return kind_; }

    bool is_sync() const { return kind_ == Kind::Sync; }

    /**
     * @brief Withdraw this request; other requests for the same key are unaffected
     *
     * Safe to call more than once and from any thread.
     */
    void cancel() const {
        if (cancel_) {
            cancel_();
        }
    }

private:
    CallbackMode(Kind kind, std::function<void()> cancel) : kind_(kind), cancel_(std::move(cancel)) {}

    Kind kind_;
    std::function<void()> cancel_;
};

/**
 * @brief Where add_user_provided() stores seeded content
 */
struct UserProvidedDestinations {
    bool memory;
    bool disk;

    UserProvidedDestinations(bool memory_ = true, bool disk_ = true) : memory(memory_), disk(disk_) {}
};

/**
 * @brief Resolve the default collaborators (HttpFetcher, RasterCodec, RasterTransform)
 *        through a ServiceContainer
 */
void register_default_services(ServiceContainer& container, const HttpFetcherConfig& http);

class ContentCache {
public:
    using ResultCallback = std::function<void(const ContentPtr&)>;
    using StoreCallback = std::function<void(bool)>;

    /**
     * @brief Pluggable collaborators
     */
    struct Collaborators {
        std::shared_ptr<IFetcher> fetcher;
        std::shared_ptr<ICodec> codec;
        std::shared_ptr<IContentTransform> transform;
        NotificationCenter* notifications = nullptr;   ///< nullptr selects the default center

        /**
         * @brief HttpFetcher, RasterCodec and RasterTransform built from @p http
         */
        static Collaborators defaults(const HttpFetcherConfig& http = HttpFetcherConfig());

        /**
         * @brief Resolve every collaborator from a container
         *
         * @throws ConfigurationError if a capability is not registered
         */
        static Collaborators from_container(ServiceContainer& container);
    };

    explicit ContentCache(const CacheConfig& config);

    /**
     * @throws ConfigurationError if a collaborator is missing or the config is invalid
     */
    ContentCache(const CacheConfig& config, Collaborators collaborators);

    /**
     * @brief Stops observing lifecycle signals, then stops the workers and the
     *        callback queue; pending deliveries still run
     *
     * Must not be called from a result callback.
     */
    ~ContentCache();

    ContentCache(const ContentCache&) = delete;
    ContentCache& operator=(const ContentCache&) = delete;

    /**
     * @brief Resolve @p key, delivering exactly once unless cancelled
     *
     * @param key Locator plus transform
     * @param on_result Receives the content, or nullptr on failure
     * @return Sync for a memory hit; otherwise Async with a cancel handle
     */
    CallbackMode fetch(const CacheKey& key, ResultCallback on_result);

    CallbackMode fetch(const std::string& locator, const TransformDescriptor& transform,
                       ResultCallback on_result) {
        return fetch(CacheKey(locator, transform), std::move(on_result));
    }

    /**
     * @brief Seed content under a caller-chosen key, bypassing the network
     *
     * The disk write runs on a worker; @p on_stored (optional) runs on the
     * callback queue once every requested destination has been written.
     */
    void add_user_provided(const ContentPtr& content, const std::string& key,
                           UserProvidedDestinations destinations = UserProvidedDestinations(),
                           StoreCallback on_stored = nullptr);

    /**
     * @brief Resolve a transform of seeded content; never touches the network
     */
    CallbackMode fetch_user_provided(const std::string& key, const TransformDescriptor& transform,
                                     ResultCallback on_result) {
        return fetch(CacheKey(user_provided_locator(key), transform), std::move(on_result));
    }

    /**
     * @brief Change the disk budget and trim to it; nullopt disables trimming
     */
    void set_byte_limit(std::optional<uint64_t> byte_limit);

    std::optional<uint64_t> byte_limit() const;

    /**
     * @brief Trim the disk store to the current budget on a worker thread
     */
    void trim_stale_files();

    void remove_all_from_memory();

    /**
     * @brief Delete every artifact; leaves an empty, existing directory
     * @return false if the directory could not be fully cleared
     */
    bool remove_all_from_disk();

    void set_unique_name_function(UniqueNameFunction unique_name);

    void set_remove_memory_on_background(bool value) { memory_.set_remove_all_on_background(value); }

    bool remove_memory_on_background() const { return memory_.remove_all_on_background(); }

    /**
     * @brief Block until no work is queued or running on the workers or the callback queue
     *
     * Must not be called from a result callback.
     */
    void wait_until_idle();

    std::filesystem::path artifact_path(const CacheKey& key) const { return paths_->path_for(key); }

    const std::filesystem::path& directory() const { return store_->directory(); }

    size_t memory_count() const { return memory_.size(); }

    /**
     * @brief Requests attached to the in-flight download of @p locator
     */
    size_t pending_downloads(const std::string& locator) const { return download_registry_.request_count(locator); }

    /**
     * @brief Memory tier lookup without touching disk or network
     */
    ContentPtr cached(const CacheKey& key) const;

    DispatchQueue& callback_queue() { return *callback_queue_; }

private:
    struct PendingRequest;
    using PendingRequestPtr = std::shared_ptr<PendingRequest>;
    using DownloadOutcome = std::optional<DownloadResult>;

    void check_disk(const CacheKey& key, const PendingRequestPtr& pending, const ResultCallback& on_result);
    void start_download(const CacheKey& key, const PendingRequestPtr& pending, const ResultCallback& on_result);
    void on_download_finished(const CacheKey& key, const PendingRequestPtr& pending,
                              const ResultCallback& on_result, const DownloadOutcome& outcome);
    void cancel_pending(const CacheKey& key, const PendingRequestPtr& pending);
    DownloadOutcome seeded_source(const std::string& locator) const;
    void handle_signal(LifecycleSignal signal);

    std::shared_ptr<ActivityTracker> tracker_;
    std::unique_ptr<DispatchQueue> callback_queue_;
    std::unique_ptr<WorkerPool> worker_pool_;

    Collaborators collaborators_;
    NotificationCenter& notifications_;
    std::shared_ptr<DiskStore> store_;
    std::shared_ptr<ArtifactPaths> paths_;
    std::unique_ptr<Downloader> downloader_;
    std::unique_ptr<Transformer> transformer_;

    MemoryCache<CacheKey, ContentPtr, CacheKeyHash> memory_;
    SingleFlightRegistry<std::string, DownloadOutcome> download_registry_;
    SingleFlightRegistry<CacheKey, ContentPtr, CacheKeyHash> format_registry_;
    SingleFlightRegistry<CacheKey, bool, CacheKeyHash> user_disk_registry_;

    mutable std::mutex limit_mutex_;
    std::optional<uint64_t> byte_limit_;

    std::shared_ptr<int> alive_;
    std::vector<NotificationCenter::ObserverId> observer_ids_;
};

} // namespace flightcache

#endif // FLIGHTCACHE_CONTENT_CACHE_HPP
