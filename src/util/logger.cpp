/**
 * @file logger.cpp
 * @brief Implementation of structured logger
 */

#include "util/logger.hpp"
#include <iostream>
#include <sstream>
#include <iomanip>
#include <ctime>

namespace flightcache {

Logger& Logger::get_instance() {
    static Logger instance;
    return instance;
}

Logger::Logger() {
    config_ = LoggerConfig();
}

Logger::~Logger() {
    flush();
    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->close();
    }
}

void Logger::configure(const LoggerConfig& config) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_ = config;
    file_stream_.reset();

    if (config_.enable_file) {
        file_stream_ = std::make_unique<std::ofstream>(config_.log_file_path, std::ios::app);
        if (!file_stream_->is_open()) {
            std::cerr << "Warning: Failed to open log file: " << config_.log_file_path << std::endl;
        }
    }
}

void Logger::add_context(std::map<std::string, std::string>& fields, const CacheEventContext& ctx) {
    fields["locator"] = ctx.locator;
    if (!ctx.transform.empty()) {
        fields["transform"] = ctx.transform;
    }
    if (!ctx.stage.empty()) {
        fields["stage"] = ctx.stage;
    }
}

void Logger::log_cache_hit(const CacheEventContext& ctx) {
    std::map<std::string, std::string> fields;
    fields["event"] = "cache_hit";
    add_context(fields, ctx);

    log(LogLevel::DEBUG, "Cache hit", std::move(fields));
}

void Logger::log_download_start(const CacheEventContext& ctx) {
    std::map<std::string, std::string> fields;
    fields["event"] = "download_start";
    add_context(fields, ctx);

    log(LogLevel::INFO, "Starting download", std::move(fields));
}

void Logger::log_download_complete(const CacheEventContext& ctx, size_t bytes,
                                   double duration_ms, bool fresh) {
    std::map<std::string, std::string> fields;
    fields["event"] = "download_complete";
    add_context(fields, ctx);
    fields["bytes"] = std::to_string(bytes);
    fields["duration_ms"] = std::to_string(duration_ms);
    fields["source"] = fresh ? "network" : "disk";

    log(LogLevel::INFO, "Download stage complete", std::move(fields));
}

void Logger::log_transform_complete(const CacheEventContext& ctx, bool reused_from_disk,
                                    double duration_ms) {
    std::map<std::string, std::string> fields;
    fields["event"] = "transform_complete";
    add_context(fields, ctx);
    fields["reused_from_disk"] = reused_from_disk ? "true" : "false";
    fields["duration_ms"] = std::to_string(duration_ms);

    log(LogLevel::INFO, "Transform stage complete", std::move(fields));
}

void Logger::log_disk_write_failed(const CacheEventContext& ctx, const std::string& path,
                                   const std::string& reason) {
    std::map<std::string, std::string> fields;
    fields["event"] = "disk_write_failed";
    add_context(fields, ctx);
    fields["path"] = path;
    fields["reason"] = reason;

    log(LogLevel::WARN, "Failed to persist artifact", std::move(fields));
}

void Logger::log_trim(const std::string& directory, uint64_t byte_limit, size_t files_removed,
                      uint64_t bytes_removed, uint64_t bytes_remaining) {
    std::map<std::string, std::string> fields;
    fields["event"] = "trim";
    fields["directory"] = directory;
    fields["byte_limit"] = std::to_string(byte_limit);
    fields["files_removed"] = std::to_string(files_removed);
    fields["bytes_removed"] = std::to_string(bytes_removed);
    fields["bytes_remaining"] = std::to_string(bytes_remaining);

    log(files_removed > 0 ? LogLevel::INFO : LogLevel::DEBUG, "Trimmed disk storage", std::move(fields));
}

void Logger::log_request_cancelled(const CacheEventContext& ctx) {
    std::map<std::string, std::string> fields;
    fields["event"] = "request_cancelled";
    add_context(fields, ctx);

    log(LogLevel::DEBUG, "Request cancelled", std::move(fields));
}

void Logger::log_error(const CacheEventContext& ctx, const std::string& error_message) {
    std::map<std::string, std::string> fields;
    fields["event"] = "error";
    add_context(fields, ctx);
    fields["error_message"] = error_message;

    log(LogLevel::ERROR, "Cache error", std::move(fields));
}

void Logger::log_warning(const CacheEventContext& ctx, const std::string& warning_message) {
    std::map<std::string, std::string> fields;
    fields["event"] = "warning";
    add_context(fields, ctx);
    fields["warning"] = warning_message;

    log(LogLevel::WARN, warning_message, std::move(fields));
}

void Logger::log_debug(const CacheEventContext& ctx, const std::string& message) {
    std::map<std::string, std::string> fields;
    fields["event"] = "debug";
    add_context(fields, ctx);

    log(LogLevel::DEBUG, message, std::move(fields));
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (config_.enable_console) {
        std::cerr.flush();
    }
    if (file_stream_ && file_stream_->is_open()) {
        file_stream_->flush();
    }
}

void Logger::set_min_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    config_.min_level = level;
}

LogLevel Logger::get_min_level() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return config_.min_level;
}

void Logger::log(
    LogLevel level,
    const std::string& message,
    std::map<std::string, std::string> fields
) {
    std::lock_guard<std::mutex> lock(mutex_);

    // Skip if below minimum level
    if (level < config_.min_level) {
        return;
    }

    std::string output;

    if (config_.enable_json) {
        fields["timestamp"] = get_timestamp();
        fields["level"] = level_to_string(level);
        fields["message"] = message;
        output = format_json(fields);
    } else {
        std::ostringstream oss;
        oss << get_timestamp() << " [" << level_to_string(level) << "] " << message;

        if (!fields.empty()) {
            oss << " {";
            bool first = true;
            for (const auto& [key, value] : fields) {
                if (!first) oss << ", ";
                oss << key << "=" << value;
                first = false;
            }
            oss << "}";
        }

        output = oss.str();
    }

    write_output(output);
}

std::string Logger::get_timestamp() const {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()
    ) % 1000;

    std::tm tm_buf;
    localtime_r(&time_t_now, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    oss << "." << std::setfill('0') << std::setw(3) << ms.count();

    return oss.str();
}

std::string Logger::format_json(const std::map<std::string, std::string>& fields) const {
    std::ostringstream oss;
    oss << "{";

    bool first = true;
    for (const auto& [key, value] : fields) {
        if (!first) oss << ",";
        oss << "\"" << escape_json_string(key) << "\":\"" << escape_json_string(value) << "\"";
        first = false;
    }

    oss << "}";
    return oss.str();
}

std::string Logger::escape_json_string(const std::string& str) const {
    std::ostringstream oss;
    for (char c : str) {
        switch (c) {
            case '"':  oss << "\\\""; break;
            case '\\': oss << "\\\\"; break;
            case '\n': oss << "\\n"; break;
            case '\r': oss << "\\r"; break;
            case '\t': oss << "\\t"; break;
            default:
                if (c >= 0 && c < 32) {
                    // Escape control characters
                    oss << "\\u" << std::hex << std::setw(4) << std::setfill('0') << static_cast<int>(c);
                } else {
                    oss << c;
                }
        }
    }
    return oss.str();
}

void Logger::write_output(const std::string& output) {
    if (config_.enable_console) {
        std::cerr << output << std::endl;
    }

    if (config_.enable_file && file_stream_ && file_stream_->is_open()) {
        *file_stream_ << output << std::endl;
    }
}

} // namespace flightcache
