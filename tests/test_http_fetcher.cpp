#include <catch2/catch.hpp>
#include "net/http_fetcher.hpp"
#include "core/errors.hpp"
#include "test_helpers.hpp"
#include <fstream>

using namespace flightcache;
using namespace flightcache::testing;

namespace {

std::string file_locator(const std::filesystem::path& path) {
    return "file://" + path.string();
}

} // namespace

TEST_CASE("HttpFetcher retry policy", "[http]") {
    REQUIRE(HttpFetcher::should_retry(408));
    REQUIRE(HttpFetcher::should_retry(429));
    REQUIRE(HttpFetcher::should_retry(500));
    REQUIRE(HttpFetcher::should_retry(503));
    REQUIRE_FALSE(HttpFetcher::should_retry(0));
    REQUIRE_FALSE(HttpFetcher::should_retry(200));
    REQUIRE_FALSE(HttpFetcher::should_retry(404));
    REQUIRE_FALSE(HttpFetcher::should_retry(600));
}

TEST_CASE("HttpFetcher configuration", "[http]") {
    HttpFetcherConfig config;
    config.max_retries = 0;
    HttpFetcher fetcher(config);
    REQUIRE(fetcher.config().max_retries == 1);
}

TEST_CASE("HttpFetcher file transfers", "[http]") {
    TempDir dir("http");
    auto path = dir.path() / "resource.fcrs";
    Bytes bytes = sample_bytes();
    {
        std::ofstream out(path, std::ios::binary);
        out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    }

    HttpFetcher fetcher;
    CancellationToken token;

    SECTION("Reads the whole body") {
        FetchResponse response = fetcher.fetch(file_locator(path), token);
        REQUIRE(response.status_code == 0);
        REQUIRE(response.body == bytes);
    }

    SECTION("Missing file fails without retrying") {
        try {
            fetcher.fetch(file_locator(dir.path() / "missing.fcrs"), token);
            FAIL("Expected FetchError");
        } catch (const FetchError& e) {
            REQUIRE_FALSE(e.cancelled());
            REQUIRE_FALSE(HttpFetcher::should_retry(e.status_code()));
        }
    }

    SECTION("A cancelled token aborts the transfer") {
        token.cancel();
        try {
            fetcher.fetch(file_locator(path), token);
            FAIL("Expected FetchError");
        } catch (const FetchError& e) {
            REQUIRE(e.cancelled());
        }
    }
}
