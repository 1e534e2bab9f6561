#include "content_cache.hpp"
#include "core/errors.hpp"
#include "net/http_fetcher.hpp"
#include "util/logger.hpp"
#include <exception>
#include <thread>

namespace flightcache {

namespace {

const CacheConfig& validated(const CacheConfig& config) {
    validate_cache_config(config);
    return config;
}

} // namespace

/**
 * Shared by a fetch() call's cancel handle and its pipeline stages. The
 * registry request ids are recorded as each stage is entered, so a cancel
 * reaches whichever stage is outstanding at the time.
 */
struct ContentCache::PendingRequest {
    std::mutex mutex;
    bool cancelled = false;
    std::optional<RequestId> download_id;
    std::optional<RequestId> format_id;

    bool is_cancelled() {
        std::lock_guard<std::mutex> lock(mutex);
        return cancelled;
    }
};

void register_default_services(ServiceContainer& container, const HttpFetcherConfig& http) {
    container.register_factory<IFetcher>([http](ServiceContainer&) {
        return std::make_shared<HttpFetcher>(http);
    });
    container.register_factory<ICodec>([](ServiceContainer&) {
        return std::make_shared<RasterCodec>();
    });
    container.register_factory<IContentTransform>([](ServiceContainer&) {
        return std::make_shared<RasterTransform>();
    });
}

ContentCache::Collaborators ContentCache::Collaborators::defaults(const HttpFetcherConfig& http) {
    Collaborators collaborators;
    collaborators.fetcher = std::make_shared<HttpFetcher>(http);
    collaborators.codec = std::make_shared<RasterCodec>();
    collaborators.transform = std::make_shared<RasterTransform>();
    return collaborators;
}

ContentCache::Collaborators ContentCache::Collaborators::from_container(ServiceContainer& container) {
    Collaborators collaborators;
    collaborators.fetcher = container.resolve<IFetcher>();
    collaborators.codec = container.resolve<ICodec>();
    collaborators.transform = container.resolve<IContentTransform>();
    if (container.is_registered<NotificationCenter>()) {
        collaborators.notifications = container.resolve<NotificationCenter>().get();
    }
    return collaborators;
}

ContentCache::ContentCache(const CacheConfig& config)
    : ContentCache(config, Collaborators::defaults(config.http)) {}

ContentCache::ContentCache(const CacheConfig& config, Collaborators collaborators)
    : tracker_(std::make_shared<ActivityTracker>())
    , callback_queue_(std::make_unique<DispatchQueue>("flightcache.callbacks", tracker_))
    , worker_pool_(std::make_unique<WorkerPool>(static_cast<size_t>(validated(config).worker_threads), tracker_))
    , collaborators_(std::move(collaborators))
    , notifications_(collaborators_.notifications ? *collaborators_.notifications
                                                  : NotificationCenter::default_center())
    , store_(std::make_shared<DiskStore>(config.directory))
    , paths_(std::make_shared<ArtifactPaths>(store_))
    , download_registry_(*callback_queue_, *worker_pool_)
    , format_registry_(*callback_queue_, *worker_pool_)
    , user_disk_registry_(*callback_queue_, *worker_pool_)
    , byte_limit_(config.byte_limit)
    , alive_(std::make_shared<int>(0))
{
    downloader_ = std::make_unique<Downloader>(collaborators_.fetcher, paths_);
    transformer_ = std::make_unique<Transformer>(collaborators_.codec, collaborators_.transform, paths_);
    memory_.set_remove_all_on_background(config.remove_memory_on_background);

    std::weak_ptr<void> owner = alive_;
    for (LifecycleSignal signal : {LifecycleSignal::MemoryPressure, LifecycleSignal::EnteredBackground}) {
        observer_ids_.push_back(notifications_.add_observer(signal, owner, [this](LifecycleSignal s) {
            handle_signal(s);
        }));
    }
}

ContentCache::~ContentCache() {
    for (auto id : observer_ids_) {
        notifications_.remove_observer(id);
    }

    // Wait out signal deliveries and cancel handles that pinned the token
    std::weak_ptr<int> alive = alive_;
    alive_.reset();
    while (!alive.expired()) {
        std::this_thread::yield();
    }

    worker_pool_->shutdown();
    callback_queue_->shutdown();
}

void ContentCache::handle_signal(LifecycleSignal signal) {
    CacheEventContext ctx("", "", signal_to_string(signal));
    switch (signal) {
        case LifecycleSignal::MemoryPressure:
            Logger::get_instance().log_debug(ctx, "Clearing memory cache");
            memory_.remove_all();
            break;
        case LifecycleSignal::EnteredBackground:
            if (memory_.remove_all_on_background()) {
                Logger::get_instance().log_debug(ctx, "Clearing memory cache");
                memory_.remove_all();
            }
            trim_stale_files();
            break;
    }
}

ContentPtr ContentCache::cached(const CacheKey& key) const {
    auto hit = memory_.get(key);
    return hit ? *hit : nullptr;
}

CallbackMode ContentCache::fetch(const CacheKey& key, ResultCallback on_result) {
    if (auto hit = memory_.get(key)) {
        Logger::get_instance().log_cache_hit(CacheEventContext(key.locator, key.transform.to_string(), "memory"));
        if (on_result) {
            on_result(*hit);
        }
        return CallbackMode::sync();
    }

    auto pending = std::make_shared<PendingRequest>();
    if (!worker_pool_->submit([this, key, pending, on_result]() { check_disk(key, pending, on_result); })) {
        Logger::get_instance().log_warning(CacheEventContext(key.locator, key.transform.to_string(), "disk"),
                                           "Cache is shutting down; request dropped");
    }

    std::weak_ptr<void> alive = alive_;
    return CallbackMode::async([this, alive, key, pending]() {
        auto pin = alive.lock();
        if (!pin) {
            return;
        }
        cancel_pending(key, pending);
    });
}

void ContentCache::check_disk(const CacheKey& key, const PendingRequestPtr& pending, const ResultCallback& on_result) {
    if (pending->is_cancelled()) {
        return;
    }

    ContentPtr content;
    try {
        if (store_->exists(paths_->path_for(key))) {
            content = transformer_->read_artifact(key);
        }
    } catch (const std::exception& e) {
        Logger::get_instance().log_error(CacheEventContext(key.locator, key.transform.to_string(), "disk"),
                                         std::string("Disk lookup failed: ") + e.what());
        callback_queue_->post([pending, on_result]() {
            if (!pending->is_cancelled() && on_result) {
                on_result(nullptr);
            }
        });
        return;
    }

    if (content) {
        Logger::get_instance().log_cache_hit(CacheEventContext(key.locator, key.transform.to_string(), "disk"));
        memory_.set(key, content);
        callback_queue_->post([pending, on_result, content]() {
            if (!pending->is_cancelled() && on_result) {
                on_result(content);
            }
        });
        return;
    }

    start_download(key, pending, on_result);
}

ContentCache::DownloadOutcome ContentCache::seeded_source(const std::string& locator) const {
    auto original = memory_.get(CacheKey(locator, TransformDescriptor::original()));
    if (!original || !*original) {
        return std::nullopt;
    }
    try {
        return DownloadResult::fresh(collaborators_.codec->encode(**original));
    } catch (const FlightCacheError& e) {
        Logger::get_instance().log_error(CacheEventContext(locator, "original", "download"), e.what());
        return std::nullopt;
    }
}

void ContentCache::start_download(const CacheKey& key, const PendingRequestPtr& pending,
                                  const ResultCallback& on_result) {
    std::lock_guard<std::mutex> lock(pending->mutex);
    if (pending->cancelled) {
        return;
    }

    auto token = std::make_shared<CancellationToken>();
    pending->download_id = download_registry_.add_request(
        key.locator,
        [this, key, token](SingleFlightRegistry<std::string, DownloadOutcome>::Finish finish) {
            DownloadOutcome outcome = downloader_->download(key, *token);
            if (!outcome && !token->is_cancelled() && is_user_provided_locator(key.locator)) {
                outcome = seeded_source(key.locator);
            }
            finish(std::move(outcome));
        },
        [token]() { token->cancel(); },
        nullptr,
        [this, key, pending, on_result](const DownloadOutcome& outcome) {
            on_download_finished(key, pending, on_result, outcome);
        });
}

void ContentCache::on_download_finished(const CacheKey& key, const PendingRequestPtr& pending,
                                        const ResultCallback& on_result, const DownloadOutcome& outcome) {
    {
        std::lock_guard<std::mutex> lock(pending->mutex);
        if (pending->cancelled) {
            return;
        }
        pending->download_id.reset();

        if (outcome) {
            auto token = std::make_shared<CancellationToken>();
            DownloadResult source = *outcome;
            pending->format_id = format_registry_.add_request(
                key,
                [this, key, source, token](SingleFlightRegistry<CacheKey, ContentPtr, CacheKeyHash>::Finish finish) {
                    finish(transformer_->transform(key, source, *token));
                },
                [token]() { token->cancel(); },
                [this, key](const ContentPtr& content) {
                    if (content) {
                        memory_.set(key, content);
                    }
                },
                [pending, on_result](const ContentPtr& content) {
                    if (!pending->is_cancelled() && on_result) {
                        on_result(content);
                    }
                });
            return;
        }
    }

    // Already on the callback queue
    if (on_result) {
        on_result(nullptr);
    }
}

void ContentCache::cancel_pending(const CacheKey& key, const PendingRequestPtr& pending) {
    std::optional<RequestId> download_id;
    std::optional<RequestId> format_id;
    {
        std::lock_guard<std::mutex> lock(pending->mutex);
        if (pending->cancelled) {
            return;
        }
        pending->cancelled = true;
        download_id = pending->download_id;
        format_id = pending->format_id;
    }

    Logger::get_instance().log_request_cancelled(CacheEventContext(key.locator, key.transform.to_string()));
    if (download_id) {
        download_registry_.cancel_request(*download_id);
    }
    if (format_id) {
        format_registry_.cancel_request(*format_id);
    }
}

void ContentCache::add_user_provided(const ContentPtr& content, const std::string& key,
                                     UserProvidedDestinations destinations, StoreCallback on_stored) {
    const CacheKey cache_key(user_provided_locator(key), TransformDescriptor::original());
    CacheEventContext ctx(cache_key.locator, "original", "seed");

    if (!content || !content->is_valid()) {
        Logger::get_instance().log_warning(ctx, "Ignoring invalid seeded content");
        if (on_stored) {
            callback_queue_->post([on_stored]() { on_stored(false); });
        }
        return;
    }

    if (destinations.memory) {
        memory_.set(cache_key, content);
    }

    if (!destinations.disk) {
        if (on_stored) {
            callback_queue_->post([on_stored]() { on_stored(true); });
        }
        return;
    }

    user_disk_registry_.add_request(
        cache_key,
        [this, cache_key, content, ctx](SingleFlightRegistry<CacheKey, bool, CacheKeyHash>::Finish finish) {
            const auto path = paths_->path_for(cache_key);
            std::string write_error;
            bool written = false;
            try {
                written = store_->write(path, collaborators_.codec->encode(*content), &write_error);
            } catch (const FlightCacheError& e) {
                write_error = e.what();
            }
            if (!written) {
                Logger::get_instance().log_disk_write_failed(ctx, path.string(), write_error);
            }
            finish(written);
        },
        nullptr,
        nullptr,
        [on_stored](const bool& written) {
            if (on_stored) {
                on_stored(written);
            }
        });
}

void ContentCache::set_byte_limit(std::optional<uint64_t> byte_limit) {
    {
        std::lock_guard<std::mutex> lock(limit_mutex_);
        byte_limit_ = byte_limit;
    }
    trim_stale_files();
}

std::optional<uint64_t> ContentCache::byte_limit() const {
    std::lock_guard<std::mutex> lock(limit_mutex_);
    return byte_limit_;
}

void ContentCache::trim_stale_files() {
    worker_pool_->submit([this]() {
        auto limit = byte_limit();
        if (!limit) {
            return;
        }
        TrimResult result = store_->trim(*limit);
        if (result.over_limit) {
            Logger::get_instance().log_trim(store_->directory().string(), *limit, result.files_removed,
                                            result.bytes_removed, result.bytes_remaining);
        }
    });
}

void ContentCache::remove_all_from_memory() {
    memory_.remove_all();
}

bool ContentCache::remove_all_from_disk() {
    return store_->remove_all();
}

void ContentCache::set_unique_name_function(UniqueNameFunction unique_name) {
    paths_->set_unique_name_function(std::move(unique_name));
}

void ContentCache::wait_until_idle() {
    tracker_->wait_idle();
}

} // namespace flightcache
