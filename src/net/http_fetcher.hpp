/**
 * @file http_fetcher.hpp
 * @brief libcurl-backed fetcher with retry and timeout support
 */

#ifndef FLIGHTCACHE_HTTP_FETCHER_HPP
#define FLIGHTCACHE_HTTP_FETCHER_HPP

#include "net/fetcher.hpp"
#include <string>
#include <vector>

namespace flightcache {

struct HttpFetcherConfig {
    int request_timeout_ms;     ///< Connect/idle timeout for one attempt
    int resource_timeout_ms;    ///< Upper bound on one complete transfer
    int max_retries;            ///< Attempts for retryable failures (>= 1)
    std::vector<int> retry_delays_ms;
    std::string user_agent;

    HttpFetcherConfig()
        : request_timeout_ms(15000),
          resource_timeout_ms(90000),
          max_retries(3),
          retry_delays_ms{1000, 2000, 4000},
          user_agent("flightcache/1.0") {}
};

/**
 * @brief HTTP(S) and file:// fetcher
 *
 * Features:
 * - Exponential backoff retry on 408, 429 and 5xx responses
 * - Per-attempt and per-transfer timeouts
 * - Cancellation through the libcurl progress callback
 * - Thread-safe: each call uses its own easy handle
 */
class HttpFetcher : public IFetcher {
public:
    explicit HttpFetcher(const HttpFetcherConfig& config = HttpFetcherConfig());
    ~HttpFetcher() override;

    HttpFetcher(const HttpFetcher&) = delete;
    HttpFetcher& operator=(const HttpFetcher&) = delete;

    FetchResponse fetch(const std::string& locator, const CancellationToken& token) override;

    const HttpFetcherConfig& config() const { return config_; }

    static bool should_retry(int status_code);

private:
    FetchResponse perform_once(const std::string& locator, const CancellationToken& token) const;

    HttpFetcherConfig config_;
};

} // namespace flightcache

#endif // FLIGHTCACHE_HTTP_FETCHER_HPP
