#include "config/cache_config.hpp"
#include "core/errors.hpp"
#include <nlohmann/json.hpp>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace flightcache {

namespace {

std::optional<uint64_t> parse_byte_limit(const std::string& value) {
    if (value == "none" || value == "unbounded") {
        return std::nullopt;
    }
    if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) {
        throw ConfigurationError("byte limit must be a non-negative integer or 'none': " + value);
    }
    try {
        return static_cast<uint64_t>(std::stoull(value));
    } catch (const std::out_of_range&) {
        throw ConfigurationError("byte limit out of range: " + value);
    }
}

} // namespace

CacheConfig::CacheConfig()
    : directory(default_cache_directory()),
      byte_limit(DEFAULT_BYTE_LIMIT),
      remove_memory_on_background(false),
      worker_threads(4)
{
    logging.log_file_path = "flightcache.log";
}

std::string default_cache_directory() {
    const char* xdg = std::getenv("XDG_CACHE_HOME");
    if (xdg && *xdg) {
        return (fs::path(xdg) / "flightcache" / "Images").string();
    }
    const char* home = std::getenv("HOME");
    if (home && *home) {
        return (fs::path(home) / ".cache" / "flightcache" / "Images").string();
    }
    return "/tmp/flightcache/Images";
}

std::string expand_environment_variables(const std::string& value) {
    std::string result = value;
    size_t pos = 0;

    while ((pos = result.find('$', pos)) != std::string::npos) {
        size_t start = pos;
        pos++; // Skip '$'

        bool braces = false;
        if (pos < result.size() && result[pos] == '{') {
            braces = true;
            pos++;
        }

        size_t name_start = pos;
        while (pos < result.size() &&
               (std::isalnum(static_cast<unsigned char>(result[pos])) || result[pos] == '_')) {
            pos++;
        }
        size_t name_end = pos;

        if (braces && pos < result.size() && result[pos] == '}') {
            pos++;
        }

        // A lone '$' is kept literally
        if (name_end == name_start) {
            pos = start + 1;
            continue;
        }

        std::string var_name = result.substr(name_start, name_end - name_start);
        const char* env_value = std::getenv(var_name.c_str());
        std::string replacement = env_value ? env_value : "";

        result.replace(start, pos - start, replacement);
        pos = start + replacement.size();
    }

    return result;
}

std::string resolve_relative_path(const std::string& path, const std::string& config_file_path) {
    fs::path p(path);
    if (p.is_absolute()) {
        return path;
    }
    fs::path config_dir = fs::path(config_file_path).parent_path();
    return (config_dir / p).string();
}

void validate_cache_config(const CacheConfig& config) {
    if (config.directory.empty()) {
        throw ConfigurationError("directory must not be empty");
    }
    if (config.worker_threads < 1) {
        throw ConfigurationError("worker_threads must be at least 1");
    }
    if (config.http.request_timeout_ms <= 0) {
        throw ConfigurationError("http.request_timeout_ms must be positive");
    }
    if (config.http.resource_timeout_ms <= 0) {
        throw ConfigurationError("http.resource_timeout_ms must be positive");
    }
    if (config.http.max_retries < 1) {
        throw ConfigurationError("http.max_retries must be at least 1");
    }
}

CacheConfig parse_cache_config_from_string(const std::string& json_string) {
    CacheConfig config;

    try {
        json j = json::parse(json_string);
        if (!j.is_object()) {
            throw ConfigParseError("Config root must be a JSON object");
        }

        if (j.contains("directory")) {
            config.directory = expand_environment_variables(j["directory"].get<std::string>());
        }

        if (j.contains("byte_limit")) {
            if (j["byte_limit"].is_null()) {
                config.byte_limit = std::nullopt;
            } else {
                config.byte_limit = j["byte_limit"].get<uint64_t>();
            }
        }

        if (j.contains("remove_memory_on_background")) {
            config.remove_memory_on_background = j["remove_memory_on_background"].get<bool>();
        }

        if (j.contains("worker_threads")) {
            config.worker_threads = j["worker_threads"].get<int>();
        }

        // Parse http (optional)
        if (j.contains("http")) {
            const auto& http = j["http"];
            if (http.contains("request_timeout_ms")) {
                config.http.request_timeout_ms = http["request_timeout_ms"].get<int>();
            }
            if (http.contains("resource_timeout_ms")) {
                config.http.resource_timeout_ms = http["resource_timeout_ms"].get<int>();
            }
            if (http.contains("max_retries")) {
                config.http.max_retries = http["max_retries"].get<int>();
            }
            if (http.contains("retry_delays_ms")) {
                config.http.retry_delays_ms = http["retry_delays_ms"].get<std::vector<int>>();
            }
            if (http.contains("user_agent")) {
                config.http.user_agent = expand_environment_variables(http["user_agent"].get<std::string>());
            }
        }

        // Parse logging (optional)
        if (j.contains("logging")) {
            const auto& logging = j["logging"];
            if (logging.contains("level")) {
                config.logging.min_level = string_to_level(logging["level"].get<std::string>());
            }
            if (logging.contains("json")) {
                config.logging.enable_json = logging["json"].get<bool>();
            }
            if (logging.contains("console")) {
                config.logging.enable_console = logging["console"].get<bool>();
            }
            if (logging.contains("file")) {
                const auto& file = logging["file"];
                if (file.is_null()) {
                    config.logging.enable_file = false;
                } else {
                    config.logging.enable_file = true;
                    config.logging.log_file_path = expand_environment_variables(file.get<std::string>());
                }
            }
        }

    } catch (const json::parse_error& e) {
        throw ConfigParseError(std::string("JSON parse error: ") + e.what());
    } catch (const json::type_error& e) {
        throw ConfigParseError(std::string("JSON type error: ") + e.what());
    } catch (const json::out_of_range& e) {
        throw ConfigParseError(std::string("JSON range error: ") + e.what());
    }

    validate_cache_config(config);

    return config;
}

CacheConfig parse_cache_config_from_file(const std::string& file_path) {
    std::ifstream file(file_path);
    if (!file.is_open()) {
        throw ConfigParseError("Failed to open config file: " + file_path);
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();

    CacheConfig config = parse_cache_config_from_string(buffer.str());

    config.directory = resolve_relative_path(config.directory, file_path);
    if (config.logging.enable_file) {
        config.logging.log_file_path = resolve_relative_path(config.logging.log_file_path, file_path);
    }

    return config;
}

void apply_environment_overrides(CacheConfig& config) {
    if (const char* dir = std::getenv("FLIGHTCACHE_DIR")) {
        if (*dir) {
            config.directory = dir;
        }
    }
    if (const char* limit = std::getenv("FLIGHTCACHE_BYTE_LIMIT")) {
        if (*limit) {
            config.byte_limit = parse_byte_limit(limit);
        }
    }
    if (const char* level = std::getenv("FLIGHTCACHE_LOG_LEVEL")) {
        if (*level) {
            config.logging.min_level = string_to_level(level);
        }
    }
}

} // namespace flightcache
