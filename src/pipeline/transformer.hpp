/**
 * @file transformer.hpp
 * @brief Format stage: derived artifact from disk, or decoded, transformed and persisted
 */

#ifndef FLIGHTCACHE_TRANSFORMER_HPP
#define FLIGHTCACHE_TRANSFORMER_HPP

#include "content/raster_codec.hpp"
#include "content/raster_transform.hpp"
#include "core/cache_key.hpp"
#include "pipeline/artifact_paths.hpp"
#include "pipeline/download_result.hpp"
#include "util/cancellation_token.hpp"
#include <memory>

namespace flightcache {

class Transformer {
public:
    Transformer(std::shared_ptr<ICodec> codec,
                std::shared_ptr<IContentTransform> transform,
                std::shared_ptr<ArtifactPaths> paths);

    /**
     * @brief Produce the content for @p key from the download stage's output
     *
     * The original transform reads straight from the source; its derived
     * artifact is the original artifact. For other transforms an existing
     * derived artifact is reused; otherwise the source is decoded,
     * transformed, and the encoded result written to disk.
     *
     * An original artifact that no longer decodes is removed so the next
     * request downloads it again.
     *
     * @return nullptr on decode or transform failure, or when cancelled
     */
    ContentPtr transform(const CacheKey& key, const DownloadResult& source, const CancellationToken& token) const;

    /**
     * @brief Decode an artifact already on disk
     * @return nullptr if it is missing or does not decode
     */
    ContentPtr read_artifact(const CacheKey& key) const;

private:
    ContentPtr decode_source(const CacheKey& key, const DownloadResult& source) const;

    std::shared_ptr<ICodec> codec_;
    std::shared_ptr<IContentTransform> transform_;
    std::shared_ptr<ArtifactPaths> paths_;
};

} // namespace flightcache

#endif // FLIGHTCACHE_TRANSFORMER_HPP
