#include "pipeline/downloader.hpp"
#include "core/errors.hpp"
#include "util/logger.hpp"
#include <chrono>

namespace flightcache {

Downloader::Downloader(std::shared_ptr<IFetcher> fetcher, std::shared_ptr<ArtifactPaths> paths)
    : fetcher_(std::move(fetcher))
    , paths_(std::move(paths))
{
    if (!fetcher_) {
        throw ConfigurationError("Downloader requires a fetcher");
    }
    if (!paths_) {
        throw ConfigurationError("Downloader requires artifact paths");
    }
}

std::optional<DownloadResult> Downloader::download(const CacheKey& key, const CancellationToken& token) const {
    auto& logger = Logger::get_instance();
    CacheEventContext ctx(key.locator, TransformDescriptor::original().to_string(), "download");
    auto start = std::chrono::steady_clock::now();

    const auto original_path = paths_->original_path_for(key.locator);
    if (paths_->store().exists(original_path)) {
        auto bytes = paths_->store().read(original_path);
        if (bytes && !bytes->empty()) {
            CacheEventContext disk_ctx(ctx.locator, ctx.transform, "disk");
            logger.log_cache_hit(disk_ctx);
            return DownloadResult::previous(original_path, std::move(*bytes));
        }
        // Removed or truncated since the existence check: treat as a miss
        logger.log_debug(ctx, "Original artifact unreadable, falling through");
    }

    if (is_user_provided_locator(key.locator)) {
        logger.log_debug(ctx, "Seeded content has no original artifact on disk");
        return std::nullopt;
    }

    if (token.is_cancelled()) {
        logger.log_request_cancelled(ctx);
        return std::nullopt;
    }

    FetchResponse response;
    try {
        logger.log_download_start(ctx);
        response = fetcher_->fetch(key.locator, token);
    } catch (const FetchError& e) {
        if (e.cancelled()) {
            logger.log_request_cancelled(ctx);
        } else {
            logger.log_error(ctx, e.what());
        }
        return std::nullopt;
    } catch (const std::exception& e) {
        logger.log_error(ctx, std::string("Fetch failed: ") + e.what());
        return std::nullopt;
    }

    if (response.body.empty()) {
        logger.log_error(ctx, "Fetched an empty body");
        return std::nullopt;
    }

    std::string write_error;
    if (!paths_->store().write(original_path, response.body, &write_error)) {
        logger.log_disk_write_failed(ctx, original_path.string(), write_error);
    }

    auto end = std::chrono::steady_clock::now();
    double duration_ms = std::chrono::duration<double, std::milli>(end - start).count();
    logger.log_download_complete(ctx, response.body.size(), duration_ms, true);

    return DownloadResult::fresh(std::move(response.body));
}

} // namespace flightcache
