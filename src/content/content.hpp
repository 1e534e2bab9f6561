/**
 * @file content.hpp
 * @brief Materialized content held by the cache tiers
 */

#ifndef FLIGHTCACHE_CONTENT_HPP
#define FLIGHTCACHE_CONTENT_HPP

#include <cstdint>
#include <memory>
#include <vector>

namespace flightcache {

using Bytes = std::vector<uint8_t>;

/**
 * @brief RGBA color, 8 bits per channel
 */
struct Color {
    uint8_t r;
    uint8_t g;
    uint8_t b;
    uint8_t a;

    Color() : r(0), g(0), b(0), a(255) {}
    Color(uint8_t r_, uint8_t g_, uint8_t b_, uint8_t a_ = 255) : r(r_), g(g_), b(b_), a(a_) {}

    bool operator==(const Color& other) const {
        return r == other.r && g == other.g && b == other.b && a == other.a;
    }
    bool operator!=(const Color& other) const { return !(*this == other); }
};

/**
 * @brief Decoded raster image, row-major, interleaved channels
 *
 * channels is 3 (RGB) or 4 (RGBA); pixels.size() == width * height * channels.
 */
struct Content {
    uint32_t width;
    uint32_t height;
    uint8_t channels;
    std::vector<uint8_t> pixels;

    Content() : width(0), height(0), channels(4) {}
    Content(uint32_t width_, uint32_t height_, uint8_t channels_)
        : width(width_), height(height_), channels(channels_),
          pixels(static_cast<size_t>(width_) * height_ * channels_, 0) {}

    bool is_valid() const;

    size_t byte_size() const { return pixels.size(); }

    /**
     * @brief Read a pixel as RGBA (alpha is 255 for RGB content)
     */
    Color pixel(uint32_t x, uint32_t y) const;

    /**
     * @brief Write a pixel; the alpha component is ignored for RGB content
     */
    void set_pixel(uint32_t x, uint32_t y, const Color& color);

    bool operator==(const Content& other) const {
        return width == other.width && height == other.height &&
               channels == other.channels && pixels == other.pixels;
    }
    bool operator!=(const Content& other) const { return !(*this == other); }
};

using ContentPtr = std::shared_ptr<const Content>;

} // namespace flightcache

#endif // FLIGHTCACHE_CONTENT_HPP
