#include "content/raster_transform.hpp"
#include <algorithm>
#include <cmath>
#include <functional>
#include <memory>

namespace flightcache {

namespace {

double effective_scale(double content_scale) {
    return content_scale > 0 ? content_scale : 1.0;
}

bool output_dimensions(const Size& size, double scale, uint32_t& width, uint32_t& height) {
    const double w = std::round(size.width * scale);
    const double h = std::round(size.height * scale);
    // Also rejects NaN and infinity
    if (!(w >= 1) || !(h >= 1) || w > MAX_OUTPUT_DIMENSION || h > MAX_OUTPUT_DIMENSION) {
        return false;
    }
    width = static_cast<uint32_t>(w);
    height = static_cast<uint32_t>(h);
    return true;
}

/**
 * Place the source inside a target rectangle and sample it with nearest
 * neighbour. Pixels the source does not cover stay transparent.
 */
void draw_source(const Content& source, Content& canvas, ContentMode mode,
                 double rect_x, double rect_y, double rect_w, double rect_h)
{
    const double fx = rect_w / source.width;
    const double fy = rect_h / source.height;
    const double factor = mode == ContentMode::ScaleAspectFit ? std::min(fx, fy) : std::max(fx, fy);
    const double drawn_w = source.width * factor;
    const double drawn_h = source.height * factor;
    const double origin_x = rect_x + (rect_w - drawn_w) / 2.0;
    const double origin_y = rect_y + (rect_h - drawn_h) / 2.0;

    for (uint32_t y = 0; y < canvas.height; ++y) {
        const double sy = (y + 0.5 - origin_y) / factor;
        if (sy < 0 || sy >= source.height) {
            continue;
        }
        for (uint32_t x = 0; x < canvas.width; ++x) {
            const double sx = (x + 0.5 - origin_x) / factor;
            if (sx < 0 || sx >= source.width) {
                continue;
            }
            canvas.set_pixel(x, y, source.pixel(static_cast<uint32_t>(sx), static_cast<uint32_t>(sy)));
        }
    }
}

using ShapeTest = std::function<bool(double px, double py)>;

/**
 * Clear pixels outside the shape and paint a one-pixel border on the pixels
 * inside it that touch the outside or the canvas edge.
 */
void clip_to_shape(Content& canvas, const ShapeTest& inside, const std::optional<Border>& border) {
    const uint32_t w = canvas.width;
    const uint32_t h = canvas.height;
    std::vector<uint8_t> mask(static_cast<size_t>(w) * h, 0);
    for (uint32_t y = 0; y < h; ++y) {
        for (uint32_t x = 0; x < w; ++x) {
            mask[static_cast<size_t>(y) * w + x] = inside(x + 0.5, y + 0.5) ? 1 : 0;
        }
    }

    auto masked = [&](int64_t x, int64_t y) {
        if (x < 0 || y < 0 || x >= static_cast<int64_t>(w) || y >= static_cast<int64_t>(h)) {
            return false;
        }
        return mask[static_cast<size_t>(y) * w + static_cast<size_t>(x)] != 0;
    };

    for (uint32_t y = 0; y < h; ++y) {
        for (uint32_t x = 0; x < w; ++x) {
            if (!masked(x, y)) {
                canvas.set_pixel(x, y, Color(0, 0, 0, 0));
                continue;
            }
            if (border) {
                const int64_t ix = x;
                const int64_t iy = y;
                if (!masked(ix - 1, iy) || !masked(ix + 1, iy) || !masked(ix, iy - 1) || !masked(ix, iy + 1)) {
                    canvas.set_pixel(x, y, border->color);
                }
            }
        }
    }
}

std::shared_ptr<Content> flatten_opaque(const Content& canvas) {
    auto out = std::make_shared<Content>(canvas.width, canvas.height, 3);
    for (uint32_t y = 0; y < canvas.height; ++y) {
        for (uint32_t x = 0; x < canvas.width; ++x) {
            const Color c = canvas.pixel(x, y);
            auto blend = [&](uint8_t channel) {
                return static_cast<uint8_t>((channel * c.a + 255 * (255 - c.a)) / 255);
            };
            out->set_pixel(x, y, Color(blend(c.r), blend(c.g), blend(c.b)));
        }
    }
    return out;
}

} // namespace

ContentPtr RasterTransform::apply(const Content& content, const TransformDescriptor& descriptor) const {
    if (!content.is_valid()) {
        return nullptr;
    }

    switch (descriptor.kind()) {
        case TransformDescriptor::Kind::Original:
            return std::make_shared<Content>(content);
        case TransformDescriptor::Kind::Scaled:
            return scale(content, std::get<ScaledTransform>(descriptor.value()));
        case TransformDescriptor::Kind::Round:
            return round(content, std::get<RoundTransform>(descriptor.value()));
        case TransformDescriptor::Kind::Custom: {
            const auto& custom = std::get<CustomTransform>(descriptor.value());
            if (!custom.block) {
                return nullptr;
            }
            return custom.block(content);
        }
    }
    return nullptr;
}

ContentPtr RasterTransform::scale(const Content& content, const ScaledTransform& params) {
    if (!std::isfinite(params.bleed) || !std::isfinite(params.corner_radius)) {
        return nullptr;
    }
    const double scale = effective_scale(params.content_scale);
    uint32_t width = 0;
    uint32_t height = 0;
    if (!output_dimensions(params.size, scale, width, height)) {
        return nullptr;
    }

    auto canvas = std::make_shared<Content>(width, height, 4);
    const double bleed = params.bleed * scale;
    draw_source(content, *canvas, params.mode, -bleed, -bleed, width + 2 * bleed, height + 2 * bleed);

    const double radius = std::min(params.corner_radius * scale, std::min(width, height) / 2.0);
    if (radius > 0 || params.border) {
        const double w = width;
        const double h = height;
        clip_to_shape(*canvas, [radius, w, h](double px, double py) {
            if (radius <= 0) {
                return true;
            }
            // Only the four corner squares can fall outside a rounded rectangle
            const double cx = px < radius ? radius : (px > w - radius ? w - radius : px);
            const double cy = py < radius ? radius : (py > h - radius ? h - radius : py);
            const double dx = px - cx;
            const double dy = py - cy;
            return dx * dx + dy * dy <= radius * radius;
        }, params.border);
    }

    if (params.opaque) {
        return flatten_opaque(*canvas);
    }
    return canvas;
}

ContentPtr RasterTransform::round(const Content& content, const RoundTransform& params) {
    const double scale = effective_scale(params.content_scale);
    uint32_t width = 0;
    uint32_t height = 0;
    if (!output_dimensions(params.size, scale, width, height)) {
        return nullptr;
    }

    auto canvas = std::make_shared<Content>(width, height, 4);
    draw_source(content, *canvas, ContentMode::ScaleAspectFill, 0, 0, width, height);

    const double rx = width / 2.0;
    const double ry = height / 2.0;
    clip_to_shape(*canvas, [rx, ry](double px, double py) {
        const double nx = (px - rx) / rx;
        const double ny = (py - ry) / ry;
        return nx * nx + ny * ny <= 1.0;
    }, params.border);

    return canvas;
}

} // namespace flightcache
