#include "pipeline/transformer.hpp"
#include "core/errors.hpp"
#include "util/logger.hpp"
#include <chrono>

namespace flightcache {

Transformer::Transformer(std::shared_ptr<ICodec> codec,
                         std::shared_ptr<IContentTransform> transform,
                         std::shared_ptr<ArtifactPaths> paths)
    : codec_(std::move(codec))
    , transform_(std::move(transform))
    , paths_(std::move(paths))
{
    if (!codec_ || !transform_ || !paths_) {
        throw ConfigurationError("Transformer requires a codec, a transform and artifact paths");
    }
}

ContentPtr Transformer::read_artifact(const CacheKey& key) const {
    const auto path = paths_->path_for(key);
    auto bytes = paths_->store().read(path);
    if (!bytes) {
        return nullptr;
    }
    return codec_->decode(*bytes);
}

ContentPtr Transformer::decode_source(const CacheKey& key, const DownloadResult& source) const {
    auto& logger = Logger::get_instance();
    CacheEventContext ctx(key.locator, key.transform.to_string(), "format");

    ContentPtr content = codec_->decode(source.bytes());
    if (content) {
        return content;
    }

    if (source.is_fresh()) {
        logger.log_error(ctx, "Downloaded bytes could not be decoded");
    } else {
        logger.log_warning(ctx, "Removing undecodable original artifact " + source.path().string());
        paths_->store().remove(source.path());
    }
    return nullptr;
}

ContentPtr Transformer::transform(const CacheKey& key, const DownloadResult& source,
                                  const CancellationToken& token) const {
    auto& logger = Logger::get_instance();
    CacheEventContext ctx(key.locator, key.transform.to_string(), "format");
    auto start = std::chrono::steady_clock::now();

    auto elapsed_ms = [&start]() {
        return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
    };

    if (key.transform.kind() == TransformDescriptor::Kind::Original) {
        ContentPtr content = decode_source(key, source);
        if (content) {
            logger.log_transform_complete(ctx, !source.is_fresh(), elapsed_ms());
        }
        return content;
    }

    const auto derived_path = paths_->path_for(key);
    if (paths_->store().exists(derived_path)) {
        if (ContentPtr cached = read_artifact(key)) {
            logger.log_transform_complete(ctx, true, elapsed_ms());
            return cached;
        }
        logger.log_warning(ctx, "Removing undecodable derived artifact " + derived_path.string());
        paths_->store().remove(derived_path);
    }

    ContentPtr content = decode_source(key, source);
    if (!content) {
        return nullptr;
    }

    if (token.is_cancelled()) {
        logger.log_request_cancelled(ctx);
        return nullptr;
    }

    ContentPtr output;
    try {
        output = transform_->apply(*content, key.transform);
    } catch (const std::exception& e) {
        logger.log_error(ctx, std::string("Transform failed: ") + e.what());
        return nullptr;
    }
    if (!output || !output->is_valid()) {
        logger.log_error(ctx, "Transform produced no content");
        return nullptr;
    }

    if (token.is_cancelled()) {
        logger.log_request_cancelled(ctx);
        return nullptr;
    }

    try {
        std::string write_error;
        if (!paths_->store().write(derived_path, codec_->encode(*output), &write_error)) {
            logger.log_disk_write_failed(ctx, derived_path.string(), write_error);
        }
    } catch (const FlightCacheError& e) {
        logger.log_disk_write_failed(ctx, derived_path.string(), e.what());
    }

    logger.log_transform_complete(ctx, false, elapsed_ms());
    return output;
}

} // namespace flightcache
