#include <iostream>
#include <fstream>
#include <future>
#include <string>
#include <sstream>
#include <optional>
#include <vector>
#include "config/cache_config.hpp"
#include "content_cache.hpp"
#include "core/errors.hpp"
#include "util/logger.hpp"
#include "util/service_container.hpp"

#include <nlohmann/json.hpp>
using json = nlohmann::json;

using namespace flightcache;

namespace {

struct CLIArgs {
    std::string config_path;
    std::string command;
    std::string locator;
    std::string transform = "original";
    std::string output_path;
    std::optional<uint64_t> limit;
    bool help = false;
};

void print_usage(const char* program_name) {
    std::cerr << "flightcache v1.0.0\n\n";
    std::cerr << "Usage: " << program_name << " [--config <path>] <command> [options]\n\n";
    std::cerr << "Commands:\n";
    std::cerr << "  fetch <locator>             Resolve a resource through memory, disk and network\n";
    std::cerr << "  trim                        Trim the cache directory to its byte limit\n";
    std::cerr << "  clear                       Delete every cached artifact\n\n";
    std::cerr << "Fetch options:\n";
    std::cerr << "  --transform <value>         original | scaled:WxH[:fit|fill] | round:WxH\n";
    std::cerr << "                              (default: original)\n";
    std::cerr << "  --output <path>             Write the encoded result to a file\n\n";
    std::cerr << "Trim options:\n";
    std::cerr << "  --limit <bytes>             Byte limit (default: from config, 500000000)\n\n";
    std::cerr << "Other options:\n";
    std::cerr << "  --config <path>             JSON configuration file\n";
    std::cerr << "  --help                      Show this help message\n\n";
    std::cerr << "Environment:\n";
    std::cerr << "  FLIGHTCACHE_DIR, FLIGHTCACHE_BYTE_LIMIT, FLIGHTCACHE_LOG_LEVEL\n\n";
    std::cerr << "Examples:\n";
    std::cerr << "  " << program_name << " fetch https://example.com/a.fcrs --transform scaled:100x100:fit \\\n";
    std::cerr << "      --output thumb.fcrs\n";
    std::cerr << "  " << program_name << " --config cache.json trim --limit 1000000\n";
}

bool parse_args(int argc, char* argv[], CLIArgs& args) {
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--help" || arg == "-h") {
            args.help = true;
            return true;
        } else if (arg == "--config" && i + 1 < argc) {
            args.config_path = argv[++i];
        } else if (arg == "--transform" && i + 1 < argc) {
            args.transform = argv[++i];
        } else if (arg == "--output" && i + 1 < argc) {
            args.output_path = argv[++i];
        } else if (arg == "--limit" && i + 1 < argc) {
            args.limit = std::stoull(argv[++i]);
        } else if (!arg.empty() && arg[0] != '-' && args.command.empty()) {
            args.command = arg;
        } else if (!arg.empty() && arg[0] != '-' && args.command == "fetch" && args.locator.empty()) {
            args.locator = arg;
        } else {
            std::cerr << "Error: Unknown option or missing argument: " << arg << "\n\n";
            return false;
        }
    }
    return true;
}

/**
 * Parses "original", "scaled:WxH[:fit|fill]" or "round:WxH".
 */
TransformDescriptor parse_transform(const std::string& text) {
    if (text == "original") {
        return TransformDescriptor::original();
    }

    std::vector<std::string> parts;
    std::stringstream ss(text);
    std::string part;
    while (std::getline(ss, part, ':')) {
        parts.push_back(part);
    }

    if (parts.size() < 2) {
        throw ConfigurationError("invalid transform: " + text);
    }

    size_t x = parts[1].find('x');
    if (x == std::string::npos) {
        throw ConfigurationError("transform size must be WxH: " + parts[1]);
    }
    Size size(std::stod(parts[1].substr(0, x)), std::stod(parts[1].substr(x + 1)));

    if (parts[0] == "scaled" && parts.size() <= 3) {
        ContentMode mode = ContentMode::ScaleAspectFill;
        if (parts.size() == 3) {
            if (parts[2] == "fit") {
                mode = ContentMode::ScaleAspectFit;
            } else if (parts[2] != "fill") {
                throw ConfigurationError("content mode must be fit or fill: " + parts[2]);
            }
        }
        return TransformDescriptor::scaled(size, mode);
    }
    if (parts[0] == "round" && parts.size() == 2) {
        return TransformDescriptor::round(size);
    }
    throw ConfigurationError("invalid transform: " + text);
}

CacheConfig load_config(const CLIArgs& args) {
    CacheConfig config = args.config_path.empty() ? CacheConfig()
                                                  : parse_cache_config_from_file(args.config_path);
    apply_environment_overrides(config);
    validate_cache_config(config);
    return config;
}

int run_fetch(const CLIArgs& args, const CacheConfig& config) {
    if (args.locator.empty()) {
        std::cerr << "Error: fetch requires a locator\n";
        return 1;
    }
    TransformDescriptor transform = parse_transform(args.transform);

    ServiceContainer& container = ServiceContainer::shared();
    register_default_services(container, config.http);

    std::promise<ContentPtr> promise;
    auto future = promise.get_future();

    ContentCache cache(config, ContentCache::Collaborators::from_container(container));
    auto mode = cache.fetch(args.locator, transform, [&promise](const ContentPtr& content) {
        promise.set_value(content);
    });
    ContentPtr content = future.get();
    cache.wait_until_idle();

    json summary;
    summary["locator"] = args.locator;
    summary["transform"] = transform.to_string();
    summary["delivery"] = mode.is_sync() ? "sync" : "async";
    summary["artifact"] = cache.artifact_path(CacheKey(args.locator, transform)).string();

    if (!content) {
        summary["status"] = "failed";
        std::cout << summary.dump(2) << std::endl;
        return 2;
    }

    summary["status"] = "ok";
    summary["width"] = content->width;
    summary["height"] = content->height;
    summary["channels"] = content->channels;

    if (!args.output_path.empty()) {
        std::ofstream out(args.output_path, std::ios::binary);
        if (!out.is_open()) {
            std::cerr << "Error: Failed to open output file: " << args.output_path << "\n";
            return 1;
        }
        Bytes bytes = container.resolve<ICodec>()->encode(*content);
        out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
        summary["output"] = args.output_path;
    }

    std::cout << summary.dump(2) << std::endl;
    return 0;
}

int run_trim(const CLIArgs& args, const CacheConfig& config) {
    std::optional<uint64_t> limit = args.limit ? args.limit : config.byte_limit;

    json summary;
    summary["directory"] = config.directory;
    if (!limit) {
        summary["status"] = "unbounded";
        std::cout << summary.dump(2) << std::endl;
        return 0;
    }

    DiskStore store(config.directory);
    TrimResult result = store.trim(*limit);
    Logger::get_instance().log_trim(config.directory, *limit, result.files_removed,
                                    result.bytes_removed, result.bytes_remaining);

    summary["status"] = "ok";
    summary["byte_limit"] = *limit;
    summary["files_removed"] = result.files_removed;
    summary["bytes_removed"] = result.bytes_removed;
    summary["bytes_remaining"] = result.bytes_remaining;
    std::cout << summary.dump(2) << std::endl;
    return 0;
}

int run_clear(const CacheConfig& config) {
    DiskStore store(config.directory);
    bool cleared = store.remove_all();

    json summary;
    summary["directory"] = config.directory;
    summary["status"] = cleared ? "ok" : "failed";
    std::cout << summary.dump(2) << std::endl;
    return cleared ? 0 : 1;
}

} // namespace

int main(int argc, char* argv[]) {
    CLIArgs args;

    try {
        if (!parse_args(argc, argv, args)) {
            print_usage(argv[0]);
            return 1;
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: Invalid argument: " << e.what() << "\n\n";
        print_usage(argv[0]);
        return 1;
    }

    if (args.help || args.command.empty()) {
        print_usage(argv[0]);
        return args.help ? 0 : 1;
    }

    try {
        CacheConfig config = load_config(args);
        Logger::get_instance().configure(config.logging);

        if (args.command == "fetch") {
            return run_fetch(args, config);
        } else if (args.command == "trim") {
            return run_trim(args, config);
        } else if (args.command == "clear") {
            return run_clear(config);
        }

        std::cerr << "Error: Unknown command: " << args.command << "\n\n";
        print_usage(argv[0]);
        return 1;
    } catch (const FlightCacheError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
