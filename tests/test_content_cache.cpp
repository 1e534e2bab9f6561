#include <catch2/catch.hpp>
#include "content_cache.hpp"
#include "test_helpers.hpp"
#include <future>
#include <mutex>
#include <stdexcept>
#include <thread>

using namespace flightcache;
using namespace flightcache::testing;

namespace fs = std::filesystem;

namespace {

const std::string LOCATOR = "https://x/img";

struct CacheFixture {
    TempDir dir{"content-cache"};
    std::shared_ptr<MockFetcher> fetcher = std::make_shared<MockFetcher>();
    std::shared_ptr<CountingTransform> transform = std::make_shared<CountingTransform>();
    NotificationCenter notifications;
    std::unique_ptr<ContentCache> cache;

    explicit CacheFixture(std::optional<uint64_t> byte_limit = DEFAULT_BYTE_LIMIT) {
        fetcher->add(LOCATOR, sample_bytes());

        CacheConfig config;
        config.directory = (dir.path() / "Images").string();
        config.byte_limit = byte_limit;
        config.worker_threads = 4;

        ContentCache::Collaborators collaborators;
        collaborators.fetcher = fetcher;
        collaborators.codec = std::make_shared<RasterCodec>();
        collaborators.transform = transform;
        collaborators.notifications = &notifications;
        cache = std::make_unique<ContentCache>(config, collaborators);
    }

    ~CacheFixture() {
        fetcher->release();
        cache.reset();
    }

    ContentPtr fetch_and_wait(const CacheKey& key, bool* was_sync = nullptr) {
        std::promise<ContentPtr> promise;
        auto future = promise.get_future();
        auto mode = cache->fetch(key, [&promise](const ContentPtr& content) { promise.set_value(content); });
        if (was_sync) {
            *was_sync = mode.is_sync();
        }
        if (future.wait_for(std::chrono::seconds(5)) != std::future_status::ready) {
            return nullptr;
        }
        ContentPtr content = future.get();
        cache->wait_until_idle();
        return content;
    }
};

} // namespace

TEST_CASE("ContentCache resolves through the network once", "[content_cache]") {
    CacheFixture f;
    CacheKey key(LOCATOR, TransformDescriptor::scaled(Size(4, 4)));

    bool sync = true;
    ContentPtr first = f.fetch_and_wait(key, &sync);
    REQUIRE(first);
    REQUIRE_FALSE(sync);
    REQUIRE(first->width == 4);
    REQUIRE(f.fetcher->calls.load() == 1);

    SECTION("Populates memory and disk") {
        REQUIRE(f.cache->memory_count() == 1);
        REQUIRE(fs::exists(f.cache->artifact_path(key)));
        REQUIRE(fs::exists(f.cache->artifact_path(key.original_key())));
    }

    SECTION("A second fetch is a synchronous memory hit") {
        ContentPtr delivered;
        auto mode = f.cache->fetch(key, [&delivered](const ContentPtr& content) { delivered = content; });
        REQUIRE(mode.is_sync());
        REQUIRE(delivered == first);
        mode.cancel();
    }

    SECTION("After clearing memory the disk artifact is used without a network call") {
        f.cache->remove_all_from_memory();
        REQUIRE(f.cache->memory_count() == 0);

        ContentPtr second = f.fetch_and_wait(key, &sync);
        REQUIRE(second);
        REQUIRE_FALSE(sync);
        REQUIRE(*second == *first);
        REQUIRE(f.fetcher->calls.load() == 1);
        REQUIRE(f.transform->calls.load() == 1);
        REQUIRE(f.cache->memory_count() == 1);
    }
}

TEST_CASE("ContentCache coalesces identical concurrent fetches", "[content_cache][single_flight]") {
    CacheFixture f;
    CacheKey key(LOCATOR, TransformDescriptor::scaled(Size(4, 4)));
    const size_t n = 8;

    f.fetcher->hold();
    ResultCollector collector;
    for (size_t i = 0; i < n; ++i) {
        f.cache->fetch(key, collector.callback());
    }
    REQUIRE(wait_for([&]() { return f.cache->pending_downloads(LOCATOR) == n; }));
    f.fetcher->release();
    f.cache->wait_until_idle();

    REQUIRE(collector.count() == n);
    REQUIRE(f.fetcher->calls.load() == 1);
    REQUIRE(f.transform->calls.load() == 1);
    auto results = collector.results();
    for (const auto& result : results) {
        REQUIRE(result);
        REQUIRE(*result == *results.front());
    }
}

TEST_CASE("ContentCache cancellation", "[content_cache][cancel]") {
    CacheFixture f;
    CacheKey key(LOCATOR, TransformDescriptor::scaled(Size(4, 4)));
    const size_t n = 5;

    f.fetcher->hold();
    std::vector<std::shared_ptr<ResultCollector>> collectors;
    std::vector<CallbackMode> modes;
    for (size_t i = 0; i < n; ++i) {
        collectors.push_back(std::make_shared<ResultCollector>());
        modes.push_back(f.cache->fetch(key, collectors.back()->callback()));
    }
    REQUIRE(wait_for([&]() { return f.cache->pending_downloads(LOCATOR) == n; }));
    REQUIRE(wait_for([&]() { return f.fetcher->calls.load() == 1; }));

    SECTION("Cancelling some requests leaves the others unaffected") {
        modes[0].cancel();
        modes[3].cancel();
        REQUIRE(f.cache->pending_downloads(LOCATOR) == n - 2);

        f.fetcher->release();
        f.cache->wait_until_idle();

        REQUIRE(collectors[0]->count() == 0);
        REQUIRE(collectors[3]->count() == 0);
        for (size_t i : {1, 2, 4}) {
            REQUIRE(collectors[i]->count() == 1);
            REQUIRE(collectors[i]->results().front());
        }
        REQUIRE(f.fetcher->calls.load() == 1);
        REQUIRE(f.fetcher->cancelled_calls.load() == 0);
    }

    SECTION("Cancelling every request cancels the download once and caches nothing") {
        for (auto& mode : modes) {
            mode.cancel();
        }
        modes[2].cancel();
        REQUIRE(wait_for([&]() { return f.fetcher->cancelled_calls.load() == 1; }));
        f.cache->wait_until_idle();

        REQUIRE(f.fetcher->calls.load() == 1);
        REQUIRE(f.fetcher->cancelled_calls.load() == 1);
        REQUIRE(f.cache->memory_count() == 0);
        REQUIRE_FALSE(fs::exists(f.cache->artifact_path(key)));
        for (const auto& collector : collectors) {
            REQUIRE(collector->count() == 0);
        }
    }
}

TEST_CASE("ContentCache shares one download across transforms", "[content_cache]") {
    CacheFixture f;
    CacheKey resized(LOCATOR, TransformDescriptor::scaled(Size(100, 100)));
    CacheKey original(LOCATOR, TransformDescriptor::original());

    f.fetcher->hold();
    ResultCollector resized_results;
    ResultCollector original_results;
    f.cache->fetch(resized, resized_results.callback());
    f.cache->fetch(original, original_results.callback());
    REQUIRE(wait_for([&]() { return f.cache->pending_downloads(LOCATOR) == 2; }));
    f.fetcher->release();
    f.cache->wait_until_idle();

    REQUIRE(resized != original);
    REQUIRE(f.fetcher->calls.load() == 1);
    REQUIRE(resized_results.count() == 1);
    REQUIRE(original_results.count() == 1);
    REQUIRE(resized_results.results().front()->width == 100);
    REQUIRE(*original_results.results().front() == sample_content());

    auto resized_path = f.cache->artifact_path(resized);
    auto original_path = f.cache->artifact_path(original);
    REQUIRE(resized_path != original_path);
    REQUIRE(fs::exists(resized_path));
    REQUIRE(fs::exists(original_path));
    REQUIRE(f.cache->memory_count() == 2);
}

TEST_CASE("ContentCache failures deliver nullptr", "[content_cache][errors]") {
    CacheFixture f;

    SECTION("Unknown resource") {
        ContentPtr result = f.fetch_and_wait(CacheKey("https://x/missing", TransformDescriptor::original()));
        REQUIRE_FALSE(result);
        REQUIRE(f.cache->memory_count() == 0);
    }

    SECTION("Undecodable resource") {
        f.fetcher->add("https://x/garbage", Bytes{1, 2, 3, 4});
        ContentPtr result = f.fetch_and_wait(CacheKey("https://x/garbage", TransformDescriptor::round(Size(4, 4))));
        REQUIRE_FALSE(result);
        REQUIRE(f.cache->memory_count() == 0);
    }

    SECTION("Failures are not cached") {
        CacheKey key("https://x/later", TransformDescriptor::original());
        REQUIRE_FALSE(f.fetch_and_wait(key));
        f.fetcher->add("https://x/later", sample_bytes());
        REQUIRE(f.fetch_and_wait(key));
        REQUIRE(f.fetcher->calls.load() == 2);
    }

    SECTION("A throwing disk lookup delivers nullptr and leaves nothing pending") {
        CacheKey key(LOCATOR, TransformDescriptor::scaled(Size(4, 4)));
        f.cache->set_unique_name_function([](const std::string&) -> std::string {
            throw std::runtime_error("naming failed");
        });
        ResultCollector collector;
        f.cache->fetch(key, collector.callback());
        REQUIRE(wait_for([&]() { return collector.count() == 1; }));
        REQUIRE_FALSE(collector.results()[0]);
        f.cache->wait_until_idle();

        f.cache->set_unique_name_function(default_unique_name);
        REQUIRE(f.fetch_and_wait(key));
        REQUIRE(f.fetcher->calls.load() == 1);
    }
}

TEST_CASE("ContentCache delivers asynchronous results on its callback queue", "[content_cache][threading]") {
    CacheFixture f;
    std::mutex mutex;
    std::vector<std::thread::id> threads;
    auto record = [&](const ContentPtr&) {
        std::lock_guard<std::mutex> lock(mutex);
        threads.push_back(std::this_thread::get_id());
    };

    f.cache->fetch(CacheKey(LOCATOR, TransformDescriptor::scaled(Size(4, 4))), record);
    f.cache->fetch(CacheKey(LOCATOR, TransformDescriptor::round(Size(4, 4))), record);
    f.cache->fetch(CacheKey("https://x/missing", TransformDescriptor::original()), record);
    f.cache->wait_until_idle();

    std::lock_guard<std::mutex> lock(mutex);
    REQUIRE(threads.size() == 3);
    for (const auto& id : threads) {
        REQUIRE(id == f.cache->callback_queue().thread_id());
    }
}

TEST_CASE("ContentCache disk maintenance", "[content_cache][disk]") {
    CacheFixture f;
    CacheKey key(LOCATOR, TransformDescriptor::scaled(Size(4, 4)));
    REQUIRE(f.fetch_and_wait(key));

    SECTION("remove_all_from_disk twice leaves an empty existing directory") {
        REQUIRE(f.cache->remove_all_from_disk());
        REQUIRE(fs::is_directory(f.cache->directory()));
        REQUIRE(fs::is_empty(f.cache->directory()));

        REQUIRE(f.cache->remove_all_from_disk());
        REQUIRE(fs::is_directory(f.cache->directory()));
        REQUIRE(fs::is_empty(f.cache->directory()));
    }

    SECTION("Changing the byte limit trims immediately") {
        f.cache->set_byte_limit(0);
        f.cache->wait_until_idle();
        REQUIRE(f.cache->byte_limit().value() == 0);
        REQUIRE(fs::is_empty(f.cache->directory()));
    }

    SECTION("An unbounded limit never trims") {
        f.cache->set_byte_limit(std::nullopt);
        f.cache->wait_until_idle();
        REQUIRE_FALSE(fs::is_empty(f.cache->directory()));
    }

    SECTION("Custom unique names are used for new artifacts") {
        f.cache->set_unique_name_function([](const std::string&) { return std::string("custom"); });
        CacheKey round(LOCATOR, TransformDescriptor::round(Size(4, 4)));
        REQUIRE(f.fetch_and_wait(round));
        REQUIRE(fs::exists(f.cache->directory() / "custom_round_4_4_nil_0"));
        REQUIRE(fs::exists(f.cache->directory() / "custom_original"));
    }
}

TEST_CASE("ContentCache lifecycle signals", "[content_cache][lifecycle]") {
    CacheFixture f;
    CacheKey key(LOCATOR, TransformDescriptor::original());
    REQUIRE(f.fetch_and_wait(key));
    REQUIRE(f.cache->memory_count() == 1);

    SECTION("Memory pressure clears memory") {
        REQUIRE(f.notifications.post(LifecycleSignal::MemoryPressure) == 1);
        REQUIRE(f.cache->memory_count() == 0);
    }

    SECTION("Backgrounding keeps memory by default and trims disk") {
        f.cache->set_byte_limit(std::nullopt);
        f.cache->wait_until_idle();
        REQUIRE(f.notifications.post(LifecycleSignal::EnteredBackground) == 1);
        f.cache->wait_until_idle();
        REQUIRE(f.cache->memory_count() == 1);
        REQUIRE_FALSE(fs::is_empty(f.cache->directory()));
    }

    SECTION("Backgrounding clears memory when configured") {
        f.cache->set_remove_memory_on_background(true);
        f.notifications.post(LifecycleSignal::EnteredBackground);
        f.cache->wait_until_idle();
        REQUIRE(f.cache->memory_count() == 0);
    }

    SECTION("Observers are removed with the cache") {
        REQUIRE(f.notifications.observer_count() == 2);
        f.cache.reset();
        REQUIRE(f.notifications.observer_count() == 0);
        REQUIRE(f.notifications.post(LifecycleSignal::MemoryPressure) == 0);
    }
}

TEST_CASE("ContentCache trims disk when backgrounded", "[content_cache][lifecycle][disk]") {
    CacheFixture f(0);
    REQUIRE(f.fetch_and_wait(CacheKey(LOCATOR, TransformDescriptor::round(Size(4, 4)))));
    REQUIRE_FALSE(fs::is_empty(f.cache->directory()));

    f.notifications.post(LifecycleSignal::EnteredBackground);
    f.cache->wait_until_idle();
    REQUIRE(fs::is_empty(f.cache->directory()));
    REQUIRE(f.cache->memory_count() == 1);
}

TEST_CASE("ContentCache seeded content", "[content_cache][user_provided]") {
    CacheFixture f;
    auto content = std::make_shared<Content>(sample_content());

    SECTION("Memory and disk seeding") {
        std::promise<bool> stored;
        f.cache->add_user_provided(content, "avatar", UserProvidedDestinations(true, true),
                                   [&stored](bool ok) { stored.set_value(ok); });
        REQUIRE(stored.get_future().get());
        f.cache->wait_until_idle();

        bool sync = false;
        ContentPtr original = f.fetch_and_wait(CacheKey(user_provided_locator("avatar")), &sync);
        REQUIRE(sync);
        REQUIRE(*original == *content);

        ContentPtr round = f.fetch_and_wait(CacheKey(user_provided_locator("avatar"),
                                                     TransformDescriptor::round(Size(4, 4))));
        REQUIRE(round);
        REQUIRE(round->width == 4);
        REQUIRE(f.fetcher->calls.load() == 0);
        REQUIRE(fs::exists(f.cache->artifact_path(CacheKey(user_provided_locator("avatar")))));
    }

    SECTION("Disk-only seeding survives a memory clear") {
        std::promise<bool> stored;
        f.cache->add_user_provided(content, "banner", UserProvidedDestinations(false, true),
                                   [&stored](bool ok) { stored.set_value(ok); });
        REQUIRE(stored.get_future().get());
        f.cache->wait_until_idle();
        f.cache->remove_all_from_memory();

        std::promise<ContentPtr> promise;
        f.cache->fetch_user_provided("banner", TransformDescriptor::scaled(Size(2, 2)),
                                     [&promise](const ContentPtr& c) { promise.set_value(c); });
        ContentPtr scaled = promise.get_future().get();
        REQUIRE(scaled);
        REQUIRE(scaled->width == 2);
        REQUIRE(f.fetcher->calls.load() == 0);
    }

    SECTION("Memory-only seeding can still be transformed") {
        f.cache->add_user_provided(content, "icon", UserProvidedDestinations(true, false));
        ContentPtr scaled = f.fetch_and_wait(CacheKey(user_provided_locator("icon"),
                                                      TransformDescriptor::scaled(Size(3, 3))));
        REQUIRE(scaled);
        REQUIRE(scaled->width == 3);
        REQUIRE(f.fetcher->calls.load() == 0);
    }

    SECTION("Unknown seeded keys fail without a network call") {
        ContentPtr result = f.fetch_and_wait(CacheKey(user_provided_locator("missing")));
        REQUIRE_FALSE(result);
        REQUIRE(f.fetcher->calls.load() == 0);
    }

    SECTION("Invalid content is rejected") {
        std::promise<bool> stored;
        f.cache->add_user_provided(std::make_shared<Content>(), "broken", UserProvidedDestinations(),
                                   [&stored](bool ok) { stored.set_value(ok); });
        REQUIRE_FALSE(stored.get_future().get());
        f.cache->wait_until_idle();
        REQUIRE(f.cache->memory_count() == 0);
    }
}

TEST_CASE("ContentCache collaborators from a container", "[content_cache][container]") {
    TempDir dir("content-cache-container");
    ServiceContainer container;
    register_default_services(container, HttpFetcherConfig());

    auto fetcher = std::make_shared<MockFetcher>();
    fetcher->add(LOCATOR, sample_bytes());
    container.seed<IFetcher>(fetcher);
    auto notifications = std::make_shared<NotificationCenter>();
    container.seed<NotificationCenter>(notifications);

    auto collaborators = ContentCache::Collaborators::from_container(container);
    REQUIRE(collaborators.fetcher == fetcher);
    REQUIRE(collaborators.notifications == notifications.get());
    REQUIRE(std::dynamic_pointer_cast<RasterCodec>(collaborators.codec));

    CacheConfig config;
    config.directory = (dir.path() / "Images").string();
    ContentCache cache(config, collaborators);
    REQUIRE(notifications->observer_count() == 2);
}

TEST_CASE("ContentCache rejects invalid setup", "[content_cache][errors]") {
    TempDir dir("content-cache-invalid");
    CacheConfig config;
    config.directory = (dir.path() / "Images").string();

    SECTION("Missing fetcher") {
        ContentCache::Collaborators collaborators;
        collaborators.codec = std::make_shared<RasterCodec>();
        collaborators.transform = std::make_shared<RasterTransform>();
        REQUIRE_THROWS_AS(ContentCache(config, collaborators), ConfigurationError);
    }

    SECTION("Zero workers") {
        config.worker_threads = 0;
        REQUIRE_THROWS_AS(ContentCache(config, ContentCache::Collaborators::defaults()), ConfigurationError);
    }
}
