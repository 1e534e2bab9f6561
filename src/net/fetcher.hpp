/**
 * @file fetcher.hpp
 * @brief Network collaborator used by the download stage
 */

#ifndef FLIGHTCACHE_FETCHER_HPP
#define FLIGHTCACHE_FETCHER_HPP

#include "content/content.hpp"
#include "util/cancellation_token.hpp"
#include <chrono>
#include <string>

namespace flightcache {

/**
 * @brief Successful fetch of one resource
 */
struct FetchResponse {
    int status_code;                     ///< HTTP status, or 0 for non-HTTP schemes
    Bytes body;
    std::chrono::milliseconds duration;

    FetchResponse() : status_code(0), duration(0) {}
};

/**
 * @brief Abstract resource fetcher
 *
 * fetch() blocks the calling worker thread until the body is complete.
 * Implementations poll @p token and abort promptly once it is cancelled.
 *
 * @throws FetchError on transport failure, error status or cancellation
 */
class IFetcher {
public:
    virtual ~IFetcher() = default;

    virtual FetchResponse fetch(const std::string& locator, const CancellationToken& token) = 0;
};

} // namespace flightcache

#endif // FLIGHTCACHE_FETCHER_HPP
