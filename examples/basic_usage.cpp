/**
 * Example: resolving transformed content through flightcache
 *
 * Writes a small raster to a temporary file, then fetches it twice through a
 * ContentCache using a file:// locator: once scaled to a thumbnail and once
 * as the original. The second run of the program is served from disk.
 *
 * Run:
 *   export FLIGHTCACHE_DIR=/tmp/flightcache-example
 *   ./basic_usage
 */

#include "config/cache_config.hpp"
#include "content/raster_codec.hpp"
#include "content_cache.hpp"
#include <filesystem>
#include <fstream>
#include <future>
#include <iostream>

using namespace flightcache;

namespace {

// Write a 64x48 gradient raster and return its file:// locator
std::string write_sample(const std::filesystem::path& path) {
    Content content(64, 48, 4);
    for (uint32_t y = 0; y < content.height; ++y) {
        for (uint32_t x = 0; x < content.width; ++x) {
            content.set_pixel(x, y, Color(static_cast<uint8_t>(x * 4), static_cast<uint8_t>(y * 5), 128));
        }
    }

    Bytes bytes = RasterCodec().encode(content);
    std::ofstream out(path, std::ios::binary);
    out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    return "file://" + std::filesystem::absolute(path).string();
}

ContentPtr fetch_blocking(ContentCache& cache, const std::string& locator, const TransformDescriptor& transform) {
    std::promise<ContentPtr> promise;
    auto future = promise.get_future();
    auto mode = cache.fetch(locator, transform, [&promise](const ContentPtr& content) {
        promise.set_value(content);
    });
    std::cout << "  " << transform.to_string() << ": " << (mode.is_sync() ? "memory hit" : "async") << "\n";
    return future.get();
}

} // namespace

int main() {
    CacheConfig config;
    apply_environment_overrides(config);
    config.byte_limit = 10 * 1000 * 1000;

    const std::string locator = write_sample(std::filesystem::temp_directory_path() / "flightcache-sample.fcrs");

    ContentCache cache(config);
    std::cout << "Cache directory: " << cache.directory() << "\n";

    auto thumbnail = TransformDescriptor::scaled(Size(16, 16), ContentMode::ScaleAspectFit);
    auto original = TransformDescriptor::original();

    for (int pass = 0; pass < 2; ++pass) {
        std::cout << "Pass " << pass + 1 << "\n";
        ContentPtr small = fetch_blocking(cache, locator, thumbnail);
        ContentPtr full = fetch_blocking(cache, locator, original);
        if (!small || !full) {
            std::cerr << "Fetch failed\n";
            return 1;
        }
        std::cout << "  thumbnail " << small->width << "x" << small->height
                  << ", original " << full->width << "x" << full->height << "\n";
    }

    cache.remove_all_from_memory();
    std::cout << "After clearing memory\n";
    fetch_blocking(cache, locator, thumbnail);

    cache.wait_until_idle();
    return 0;
}
