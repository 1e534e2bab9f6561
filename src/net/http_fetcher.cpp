#include "net/http_fetcher.hpp"
#include "core/errors.hpp"
#include "util/logger.hpp"
#include <curl/curl.h>
#include <algorithm>
#include <chrono>
#include <memory>
#include <mutex>
#include <sstream>
#include <thread>

namespace flightcache {

namespace {

size_t write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t total_size = size * nmemb;
    auto* body = static_cast<Bytes*>(userp);
    const auto* data = static_cast<const uint8_t*>(contents);
    body->insert(body->end(), data, data + total_size);
    return total_size;
}

// Returning non-zero aborts the transfer with CURLE_ABORTED_BY_CALLBACK
int progress_callback(void* clientp, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    const auto* token = static_cast<const CancellationToken*>(clientp);
    return token->is_cancelled() ? 1 : 0;
}

void global_init_once() {
    static std::once_flag flag;
    std::call_once(flag, []() { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

struct EasyHandle {
    CURL* curl;

    EasyHandle() : curl(curl_easy_init()) {
        if (!curl) {
            throw FetchError("Failed to initialize CURL");
        }
    }

    ~EasyHandle() { curl_easy_cleanup(curl); }

    EasyHandle(const EasyHandle&) = delete;
    EasyHandle& operator=(const EasyHandle&) = delete;
};

} // namespace

HttpFetcher::HttpFetcher(const HttpFetcherConfig& config)
    : config_(config)
{
    if (config_.max_retries < 1) {
        config_.max_retries = 1;
    }
    global_init_once();
}

HttpFetcher::~HttpFetcher() = default;

bool HttpFetcher::should_retry(int status_code) {
    // Retry on: timeout (408), rate limit (429), server errors (500-599)
    if (status_code == 408 || status_code == 429) {
        return true;
    }
    return status_code >= 500 && status_code < 600;
}

FetchResponse HttpFetcher::perform_once(const std::string& locator, const CancellationToken& token) const {
    auto start = std::chrono::steady_clock::now();

    EasyHandle handle;
    Bytes body;

    curl_easy_setopt(handle.curl, CURLOPT_URL, locator.c_str());
    curl_easy_setopt(handle.curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(handle.curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(handle.curl, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(config_.request_timeout_ms));
    curl_easy_setopt(handle.curl, CURLOPT_TIMEOUT_MS, static_cast<long>(config_.resource_timeout_ms));
    // Abort if the transfer stalls for a whole request timeout
    curl_easy_setopt(handle.curl, CURLOPT_LOW_SPEED_LIMIT, 1L);
    curl_easy_setopt(handle.curl, CURLOPT_LOW_SPEED_TIME,
                     static_cast<long>(std::max(1, config_.request_timeout_ms / 1000)));
    if (!config_.user_agent.empty()) {
        curl_easy_setopt(handle.curl, CURLOPT_USERAGENT, config_.user_agent.c_str());
    }

    curl_easy_setopt(handle.curl, CURLOPT_WRITEFUNCTION, write_callback);
    curl_easy_setopt(handle.curl, CURLOPT_WRITEDATA, &body);
    curl_easy_setopt(handle.curl, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(handle.curl, CURLOPT_XFERINFOFUNCTION, progress_callback);
    curl_easy_setopt(handle.curl, CURLOPT_XFERINFODATA, const_cast<CancellationToken*>(&token));

    CURLcode res = curl_easy_perform(handle.curl);

    auto end = std::chrono::steady_clock::now();

    if (res == CURLE_ABORTED_BY_CALLBACK || token.is_cancelled()) {
        throw FetchError("Fetch cancelled: " + locator, 0, true);
    }
    if (res != CURLE_OK) {
        std::string error_msg = "CURL error: ";
        error_msg += curl_easy_strerror(res);
        // Transport-level timeouts are retried like a 408
        throw FetchError(error_msg, res == CURLE_OPERATION_TIMEDOUT ? 408 : 0);
    }

    long status_code = 0;
    curl_easy_getinfo(handle.curl, CURLINFO_RESPONSE_CODE, &status_code);

    // file:// and other non-HTTP schemes report 0
    if (status_code >= 400) {
        std::ostringstream oss;
        oss << "HTTP " << status_code << " for " << locator;
        throw FetchError(oss.str(), static_cast<int>(status_code));
    }

    FetchResponse response;
    response.status_code = static_cast<int>(status_code);
    response.body = std::move(body);
    response.duration = std::chrono::duration_cast<std::chrono::milliseconds>(end - start);
    return response;
}

FetchResponse HttpFetcher::fetch(const std::string& locator, const CancellationToken& token) {
    int attempt = 0;

    while (true) {
        try {
            return perform_once(locator, token);
        } catch (const FetchError& e) {
            if (e.cancelled() || !should_retry(e.status_code()) || attempt >= config_.max_retries - 1) {
                throw;
            }

            int delay_ms = 0;
            if (!config_.retry_delays_ms.empty()) {
                size_t index = std::min(static_cast<size_t>(attempt), config_.retry_delays_ms.size() - 1);
                delay_ms = config_.retry_delays_ms[index];
            }

            std::ostringstream oss;
            oss << e.what() << " - retrying in " << delay_ms << "ms";
            Logger::get_instance().log_warning(CacheEventContext(locator, "", "download"), oss.str());

            // Sleep in slices so cancellation is noticed during backoff
            auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(delay_ms);
            while (std::chrono::steady_clock::now() < deadline) {
                if (token.is_cancelled()) {
                    throw FetchError("Fetch cancelled: " + locator, 0, true);
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(10));
            }
            attempt++;
        }
    }
}

} // namespace flightcache
