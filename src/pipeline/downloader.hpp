/**
 * @file downloader.hpp
 * @brief Download stage: original artifact from disk, or fetched and persisted
 */

#ifndef FLIGHTCACHE_DOWNLOADER_HPP
#define FLIGHTCACHE_DOWNLOADER_HPP

#include "core/cache_key.hpp"
#include "net/fetcher.hpp"
#include "pipeline/artifact_paths.hpp"
#include "pipeline/download_result.hpp"
#include "util/cancellation_token.hpp"
#include <memory>
#include <optional>

namespace flightcache {

class Downloader {
public:
    Downloader(std::shared_ptr<IFetcher> fetcher, std::shared_ptr<ArtifactPaths> paths);

    /**
     * @brief Resolve the original bytes for @p key's locator
     *
     * Runs on a worker thread. An original artifact on disk is read here; if
     * it vanished since the existence check the network is used instead.
     * Seeded-content locators are never fetched.
     * A failed write of the original artifact is logged and the fresh bytes
     * are still returned.
     *
     * @return std::nullopt on network failure, empty body or cancellation
     */
    std::optional<DownloadResult> download(const CacheKey& key, const CancellationToken& token) const;

private:
    std::shared_ptr<IFetcher> fetcher_;
    std::shared_ptr<ArtifactPaths> paths_;
};

} // namespace flightcache

#endif // FLIGHTCACHE_DOWNLOADER_HPP
