#include <catch2/catch.hpp>
#include "core/memory_cache.hpp"
#include <string>
#include <thread>
#include <vector>

using namespace flightcache;

TEST_CASE("MemoryCache basic operations", "[memory_cache]") {
    MemoryCache<std::string, int> cache;

    SECTION("Miss on empty cache") {
        REQUIRE_FALSE(cache.get("a").has_value());
        REQUIRE(cache.size() == 0);
    }

    SECTION("Hit after set, last write wins") {
        cache.set("a", 1);
        cache.set("a", 2);
        REQUIRE(cache.get("a").value() == 2);
        REQUIRE(cache.size() == 1);
    }

    SECTION("remove_all empties the cache and is idempotent") {
        cache.set("a", 1);
        cache.set("b", 2);
        cache.remove_all();
        REQUIRE(cache.size() == 0);
        cache.remove_all();
        REQUIRE_FALSE(cache.get("b").has_value());
    }

    SECTION("Background flag defaults to off") {
        REQUIRE_FALSE(cache.remove_all_on_background());
        cache.set_remove_all_on_background(true);
        REQUIRE(cache.remove_all_on_background());
    }
}

TEST_CASE("MemoryCache concurrent writers", "[memory_cache]") {
    MemoryCache<int, int> cache;
    std::vector<std::thread> threads;

    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&cache, t]() {
            for (int i = 0; i < 250; ++i) {
                cache.set(t * 1000 + i, i);
                cache.get(t * 1000 + i);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    REQUIRE(cache.size() == 1000);
    REQUIRE(cache.get(3249).value() == 249);
}
