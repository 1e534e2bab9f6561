/**
 * @file raster_transform.hpp
 * @brief Default content transform: scaling, clipping and borders
 */

#ifndef FLIGHTCACHE_RASTER_TRANSFORM_HPP
#define FLIGHTCACHE_RASTER_TRANSFORM_HPP

#include "content/content.hpp"
#include "core/cache_key.hpp"

namespace flightcache {

/// Largest width or height a transform will produce, in pixels
constexpr double MAX_OUTPUT_DIMENSION = 16384;

/**
 * @brief Abstract transform applied by the format stage
 *
 * Implementations must be deterministic: the same content and descriptor
 * always produce the same output. A nullptr return is a transform failure.
 */
class IContentTransform {
public:
    virtual ~IContentTransform() = default;

    virtual ContentPtr apply(const Content& content, const TransformDescriptor& descriptor) const = 0;
};

/**
 * @brief Nearest-neighbour raster implementation of every descriptor kind
 *
 * - original: unchanged copy
 * - scaled: aspect fit/fill into size * content_scale pixels, grown by bleed on
 *   every side before placement, optional rounded corners and hairline border,
 *   opaque output is flattened onto white and drops its alpha channel
 * - round: aspect fill clipped to the inscribed oval, optional border
 * - custom: the descriptor's own function
 *
 * Sizes that are not finite, or exceed MAX_OUTPUT_DIMENSION once scaled,
 * produce nullptr.
 */
class RasterTransform : public IContentTransform {
public:
    ContentPtr apply(const Content& content, const TransformDescriptor& descriptor) const override;

private:
    static ContentPtr scale(const Content& content, const ScaledTransform& params);
    static ContentPtr round(const Content& content, const RoundTransform& params);
};

} // namespace flightcache

#endif // FLIGHTCACHE_RASTER_TRANSFORM_HPP
