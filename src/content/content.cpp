#include "content/content.hpp"

namespace flightcache {

bool Content::is_valid() const {
    if (width == 0 || height == 0) return false;
    if (channels != 3 && channels != 4) return false;
    return pixels.size() == static_cast<size_t>(width) * height * channels;
}

Color Content::pixel(uint32_t x, uint32_t y) const {
    size_t offset = (static_cast<size_t>(y) * width + x) * channels;
    if (channels == 4) {
        return Color(pixels[offset], pixels[offset + 1], pixels[offset + 2], pixels[offset + 3]);
    }
    return Color(pixels[offset], pixels[offset + 1], pixels[offset + 2]);
}

void Content::set_pixel(uint32_t x, uint32_t y, const Color& color) {
    size_t offset = (static_cast<size_t>(y) * width + x) * channels;
    pixels[offset] = color.r;
    pixels[offset + 1] = color.g;
    pixels[offset + 2] = color.b;
    if (channels == 4) {
        pixels[offset + 3] = color.a;
    }
}

} // namespace flightcache
