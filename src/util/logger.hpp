/**
 * @file logger.hpp
 * @brief Structured logging for the cache engine with JSON output
 *
 * The Logger provides structured logging capabilities with:
 * - Multiple log levels (DEBUG, INFO, WARN, ERROR)
 * - JSON-formatted output for easy parsing
 * - Context tracking (locator, transform, pipeline stage)
 * - Thread-safe emission from worker threads and the callback queue
 *
 * Design Pattern: Singleton logger with structured event emission
 */

#ifndef FLIGHTCACHE_LOGGER_HPP
#define FLIGHTCACHE_LOGGER_HPP

#include <string>
#include <map>
#include <memory>
#include <mutex>
#include <chrono>
#include <fstream>
#include <cstdint>

namespace flightcache {

/**
 * @brief Log severity levels
 */
enum class LogLevel {
    DEBUG,   ///< Detailed debugging information (registry attach/detach, disk lookups)
    INFO,    ///< Informational messages (downloads, transforms, trims)
    WARN,    ///< Warning messages (disk write failures, corrupt artifacts)
    ERROR    ///< Error messages (network or decode failures)
};

/**
 * @brief Convert log level to string
 */
inline std::string level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO: return "INFO";
        case LogLevel::WARN: return "WARN";
        case LogLevel::ERROR: return "ERROR";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Parse log level from string
 */
inline LogLevel string_to_level(const std::string& level_str) {
    if (level_str == "DEBUG") return LogLevel::DEBUG;
    if (level_str == "INFO") return LogLevel::INFO;
    if (level_str == "WARN") return LogLevel::WARN;
    if (level_str == "ERROR") return LogLevel::ERROR;
    return LogLevel::INFO;  // default
}

/**
 * @brief Pipeline context attached to every cache event
 */
struct CacheEventContext {
    std::string locator;     ///< Resource locator (URL or seeded key locator)
    std::string transform;   ///< Human-readable transform descriptor
    std::string stage;       ///< Pipeline stage (memory, disk, download, format, trim)

    CacheEventContext() = default;

    CacheEventContext(const std::string& locator_, const std::string& transform_,
                      const std::string& stage_ = "")
        : locator(locator_), transform(transform_), stage(stage_) {}
};

/**
 * @brief Logger configuration
 */
struct LoggerConfig {
    LogLevel min_level;              ///< Minimum log level to output
    bool enable_console;             ///< Log to console (stderr)
    bool enable_file;                ///< Log to file
    std::string log_file_path;       ///< File path for logs
    bool enable_json;                ///< Output as JSON (vs. plain text)

    LoggerConfig()
        : min_level(LogLevel::INFO),
          enable_console(true),
          enable_file(false),
          log_file_path("flightcache.log"),
          enable_json(true) {}
};

/**
 * @brief Structured logger with JSON output
 *
 * Usage Example:
 *   @code
 *   LoggerConfig config;
 *   config.min_level = LogLevel::DEBUG;
 *   Logger::get_instance().configure(config);
 *
 *   CacheEventContext ctx("https://x/img", "original", "download");
 *   Logger::get_instance().log_download_complete(ctx, 2048, 35.0, true);
 *   @endcode
 */
class Logger {
public:
    /**
     * @brief Get singleton logger instance
     */
    static Logger& get_instance();

    /**
     * @brief Configure logger with new settings
     */
    void configure(const LoggerConfig& config);

    /**
     * @brief Log a hit in one of the cache tiers
     *
     * @param ctx Event context; ctx.stage names the tier ("memory" or "disk")
     */
    void log_cache_hit(const CacheEventContext& ctx);

    /**
     * @brief Log the start of a network fetch
     */
    void log_download_start(const CacheEventContext& ctx);

    /**
     * @brief Log the end of a download stage
     *
     * @param ctx Event context
     * @param bytes Number of bytes fetched (0 when resolved from disk)
     * @param duration_ms Wall time of the stage
     * @param fresh True if the bytes came from the network
     */
    void log_download_complete(const CacheEventContext& ctx, size_t bytes,
                               double duration_ms, bool fresh);

    /**
     * @brief Log the end of a transform stage
     */
    void log_transform_complete(const CacheEventContext& ctx, bool reused_from_disk,
                                double duration_ms);

    /**
     * @brief Log a failed artifact write; the in-memory result is still delivered
     */
    void log_disk_write_failed(const CacheEventContext& ctx, const std::string& path,
                               const std::string& reason);

    /**
     * @brief Log the outcome of a byte-budget trim
     */
    void log_trim(const std::string& directory, uint64_t byte_limit, size_t files_removed,
                  uint64_t bytes_removed, uint64_t bytes_remaining);

    void log_request_cancelled(const CacheEventContext& ctx);

    void log_error(const CacheEventContext& ctx, const std::string& error_message);

    void log_warning(const CacheEventContext& ctx, const std::string& warning_message);

    void log_debug(const CacheEventContext& ctx, const std::string& message);

    /**
     * @brief Flush all log outputs
     */
    void flush();

    void set_min_level(LogLevel level);

    LogLevel get_min_level() const;

private:
    Logger();
    ~Logger();

    // Disable copy and move
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;
    Logger(Logger&&) = delete;
    Logger& operator=(Logger&&) = delete;

    mutable std::mutex mutex_;
    LoggerConfig config_;
    std::unique_ptr<std::ofstream> file_stream_;

    // Helper methods
    void log(LogLevel level, const std::string& message, std::map<std::string, std::string> fields);
    static void add_context(std::map<std::string, std::string>& fields, const CacheEventContext& ctx);
    std::string get_timestamp() const;
    std::string format_json(const std::map<std::string, std::string>& fields) const;
    std::string escape_json_string(const std::string& str) const;
    void write_output(const std::string& output);
};

} // namespace flightcache

#endif // FLIGHTCACHE_LOGGER_HPP
