#include "content/raster_codec.hpp"
#include "core/errors.hpp"
#include <memory>

namespace flightcache {

namespace {

constexpr uint8_t MAGIC[4] = {'F', 'C', 'R', 'S'};

void put_u32(Bytes& out, uint32_t value) {
    out.push_back(static_cast<uint8_t>(value & 0xFF));
    out.push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
    out.push_back(static_cast<uint8_t>((value >> 16) & 0xFF));
    out.push_back(static_cast<uint8_t>((value >> 24) & 0xFF));
}

uint32_t get_u32(const Bytes& in, size_t offset) {
    return static_cast<uint32_t>(in[offset]) |
           (static_cast<uint32_t>(in[offset + 1]) << 8) |
           (static_cast<uint32_t>(in[offset + 2]) << 16) |
           (static_cast<uint32_t>(in[offset + 3]) << 24);
}

} // namespace

constexpr uint8_t RasterCodec::FORMAT_VERSION;
constexpr size_t RasterCodec::HEADER_SIZE;

ContentPtr RasterCodec::decode(const Bytes& bytes) const {
    if (bytes.size() < HEADER_SIZE) {
        return nullptr;
    }
    for (size_t i = 0; i < 4; ++i) {
        if (bytes[i] != MAGIC[i]) {
            return nullptr;
        }
    }
    if (bytes[4] != FORMAT_VERSION) {
        return nullptr;
    }

    const uint32_t width = get_u32(bytes, 5);
    const uint32_t height = get_u32(bytes, 9);
    const uint8_t channels = bytes[13];
    if (width == 0 || height == 0 || (channels != 3 && channels != 4)) {
        return nullptr;
    }

    const uint64_t pixel_bytes = static_cast<uint64_t>(width) * height * channels;
    if (bytes.size() - HEADER_SIZE != pixel_bytes) {
        return nullptr;
    }

    auto content = std::make_shared<Content>();
    content->width = width;
    content->height = height;
    content->channels = channels;
    content->pixels.assign(bytes.begin() + HEADER_SIZE, bytes.end());
    return content;
}

Bytes RasterCodec::encode(const Content& content) const {
    if (!content.is_valid()) {
        throw FlightCacheError("Cannot encode invalid content");
    }

    Bytes out;
    out.reserve(HEADER_SIZE + content.pixels.size());
    out.insert(out.end(), MAGIC, MAGIC + 4);
    out.push_back(FORMAT_VERSION);
    put_u32(out, content.width);
    put_u32(out, content.height);
    out.push_back(content.channels);
    out.insert(out.end(), content.pixels.begin(), content.pixels.end());
    return out;
}

} // namespace flightcache
