#ifndef FLIGHTCACHE_CACHE_CONFIG_HPP
#define FLIGHTCACHE_CACHE_CONFIG_HPP

#include "net/http_fetcher.hpp"
#include "util/logger.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace flightcache {

/**
 * @brief Default disk budget: 500 MB
 */
constexpr uint64_t DEFAULT_BYTE_LIMIT = 500ULL * 1000 * 1000;

/**
 * @brief Complete cache configuration
 */
struct CacheConfig {
    std::string directory;                 // Artifact directory
    std::optional<uint64_t> byte_limit;    // nullopt = unbounded
    bool remove_memory_on_background;      // Also clear memory on EnteredBackground
    int worker_threads;                    // Worker pool size
    HttpFetcherConfig http;
    LoggerConfig logging;

    CacheConfig();
};

/**
 * @brief Checks value ranges of a configuration
 *
 * @throws ConfigurationError if a value is out of range
 */
void validate_cache_config(const CacheConfig& config);

/**
 * @brief Parses a cache configuration from a JSON string
 *
 * Every field is optional; missing fields keep their defaults. String values
 * have environment variables expanded. "byte_limit": null means unbounded.
 *
 * @param json_string JSON configuration as string
 * @return Parsed configuration
 * @throws ConfigParseError if JSON is invalid
 * @throws ConfigurationError if configuration is invalid
 */
CacheConfig parse_cache_config_from_string(const std::string& json_string);

/**
 * @brief Parses a cache configuration from a JSON file
 *
 * A relative "directory" is resolved against the config file's directory.
 *
 * @throws ConfigParseError if the file cannot be read or JSON is invalid
 * @throws ConfigurationError if configuration is invalid
 */
CacheConfig parse_cache_config_from_file(const std::string& file_path);

/**
 * @brief Applies FLIGHTCACHE_DIR, FLIGHTCACHE_BYTE_LIMIT and FLIGHTCACHE_LOG_LEVEL
 *
 * FLIGHTCACHE_BYTE_LIMIT accepts a byte count or "none".
 *
 * @throws ConfigurationError if FLIGHTCACHE_BYTE_LIMIT is not a number
 */
void apply_environment_overrides(CacheConfig& config);

/**
 * @brief Platform cache directory for artifacts
 *
 * $XDG_CACHE_HOME/flightcache/Images, else $HOME/.cache/flightcache/Images,
 * else /tmp/flightcache/Images.
 */
std::string default_cache_directory();

/**
 * @brief Expands environment variable references in a string
 *
 * Supports syntax: ${VAR_NAME} or $VAR_NAME. Unset variables expand to "".
 */
std::string expand_environment_variables(const std::string& value);

/**
 * @brief Resolves a path relative to the directory of a config file
 *
 * Absolute paths are returned unchanged.
 */
std::string resolve_relative_path(const std::string& path, const std::string& config_file_path);

} // namespace flightcache

#endif // FLIGHTCACHE_CACHE_CONFIG_HPP
