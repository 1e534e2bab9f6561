/**
 * @file raster_codec.hpp
 * @brief Conversion between stored artifact bytes and decoded content
 */

#ifndef FLIGHTCACHE_RASTER_CODEC_HPP
#define FLIGHTCACHE_RASTER_CODEC_HPP

#include "content/content.hpp"
#include <cstdint>

namespace flightcache {

/**
 * @brief Abstract codec used by the transform stage
 *
 * decode() returns nullptr for bytes it cannot interpret; it never throws.
 */
class ICodec {
public:
    virtual ~ICodec() = default;

    virtual ContentPtr decode(const Bytes& bytes) const = 0;

    virtual Bytes encode(const Content& content) const = 0;
};

/**
 * @brief Uncompressed, versioned raster container
 *
 * Layout (little-endian):
 * - 4 bytes  magic "FCRS"
 * - 1 byte   version (1)
 * - 4 bytes  width
 * - 4 bytes  height
 * - 1 byte   channels (3 or 4)
 * - width * height * channels pixel bytes, row-major
 */
class RasterCodec : public ICodec {
public:
    static constexpr uint8_t FORMAT_VERSION = 1;
    static constexpr size_t HEADER_SIZE = 14;

    ContentPtr decode(const Bytes& bytes) const override;

    Bytes encode(const Content& content) const override;
};

} // namespace flightcache

#endif // FLIGHTCACHE_RASTER_CODEC_HPP
