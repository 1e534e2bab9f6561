/**
 * @file errors.hpp
 * @brief Exception hierarchy used inside the cache engine
 *
 * None of these cross the public ContentCache boundary: the pipeline stages
 * catch them, log them and collapse them into a nil result.
 */

#ifndef FLIGHTCACHE_ERRORS_HPP
#define FLIGHTCACHE_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace flightcache {

/**
 * @brief Base exception for flightcache errors
 */
class FlightCacheError : public std::runtime_error {
public:
    explicit FlightCacheError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @brief Raised when a resource cannot be fetched
 */
class FetchError : public FlightCacheError {
public:
    FetchError(const std::string& message, int status_code = 0, bool cancelled = false)
        : FlightCacheError(message), status_code_(status_code), cancelled_(cancelled) {}

    int status_code() const { return status_code_; }
    bool cancelled() const { return cancelled_; }

private:
    int status_code_;
    bool cancelled_;
};

/**
 * @brief Raised when configuration is invalid
 */
class ConfigurationError : public FlightCacheError {
public:
    explicit ConfigurationError(const std::string& message)
        : FlightCacheError("Configuration error: " + message) {}
};

/**
 * @brief Raised when a config file cannot be read or its JSON is invalid
 */
class ConfigParseError : public FlightCacheError {
public:
    explicit ConfigParseError(const std::string& message)
        : FlightCacheError(message) {}
};

} // namespace flightcache

#endif // FLIGHTCACHE_ERRORS_HPP
