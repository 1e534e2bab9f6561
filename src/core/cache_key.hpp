/**
 * @file cache_key.hpp
 * @brief Cache identity: resource locator plus transform descriptor
 *
 * Everything here is pure: equality, hashing and the filename suffix are
 * deterministic functions of the descriptor's parameters.
 *
 * Filename suffixes truncate every numeric parameter to whole units, so two
 * transforms that differ only below one unit share a disk file while still
 * being distinct memory entries.
 */

#ifndef FLIGHTCACHE_CACHE_KEY_HPP
#define FLIGHTCACHE_CACHE_KEY_HPP

#include "content/content.hpp"
#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <variant>

namespace flightcache {

struct Size {
    double width;
    double height;

    Size() : width(0), height(0) {}
    Size(double width_, double height_) : width(width_), height(height_) {}

    bool operator==(const Size& other) const {
        return width == other.width && height == other.height;
    }
};

/**
 * @brief How the source is scaled relative to the requested size
 */
enum class ContentMode {
    ScaleAspectFill,   ///< Cover the whole target, cropping overflow
    ScaleAspectFit     ///< Fit entirely inside the target, leaving transparent margins
};

/**
 * @brief One-unit border drawn around the clipped output
 */
struct Border {
    Color color;

    Border() = default;
    explicit Border(const Color& color_) : color(color_) {}

    bool operator==(const Border& other) const { return color == other.color; }
};

struct OriginalTransform {};

struct ScaledTransform {
    Size size;
    ContentMode mode = ContentMode::ScaleAspectFill;
    double bleed = 0;
    bool opaque = false;
    double corner_radius = 0;
    std::optional<Border> border;
    double content_scale = 0;   ///< Pixels per unit; 0 selects the default of 1
};

struct RoundTransform {
    Size size;
    std::optional<Border> border;
    double content_scale = 0;
};

/**
 * @brief Caller-defined transform identified solely by its edit key
 *
 * Two custom transforms with the same edit key are the same cache entry even
 * if their functions differ. Callers must keep edit keys unique per behavior.
 */
struct CustomTransform {
    std::string edit_key;
    std::function<ContentPtr(const Content&)> block;
};

/**
 * @brief Closed set of transforms applied to downloaded content
 */
class TransformDescriptor {
public:
    using Variant = std::variant<OriginalTransform, ScaledTransform, RoundTransform, CustomTransform>;

    enum class Kind { Original, Scaled, Round, Custom };

    TransformDescriptor() : value_(OriginalTransform{}) {}

    static TransformDescriptor original();

    static TransformDescriptor scaled(Size size,
                                      ContentMode mode = ContentMode::ScaleAspectFill,
                                      double bleed = 0,
                                      bool opaque = false,
                                      double corner_radius = 0,
                                      std::optional<Border> border = std::nullopt,
                                      double content_scale = 0);

    static TransformDescriptor round(Size size,
                                     std::optional<Border> border = std::nullopt,
                                     double content_scale = 0);

    static TransformDescriptor custom(const std::string& edit_key,
                                      std::function<ContentPtr(const Content&)> block);

    Kind kind() const { return static_cast<Kind>(value_.index()); }

    const Variant& value() const { return value_; }

    bool operator==(const TransformDescriptor& other) const;
    bool operator!=(const TransformDescriptor& other) const { return !(*this == other); }

    size_t hash() const;

    /**
     * @brief Filename-safe suffix, e.g. "_original" or "_round_100_100_nil_2"
     */
    std::string disk_suffix() const;

    /**
     * @brief Readable form for logs, e.g. "scaled(100x100, fill)"
     */
    std::string to_string() const;

private:
    explicit TransformDescriptor(Variant value) : value_(std::move(value)) {}

    Variant value_;
};

/**
 * @brief Identity of one cache entry
 */
struct CacheKey {
    std::string locator;
    TransformDescriptor transform;

    CacheKey() = default;
    CacheKey(std::string locator_, TransformDescriptor transform_ = TransformDescriptor())
        : locator(std::move(locator_)), transform(std::move(transform_)) {}

    /**
     * @brief Same locator, original transform
     */
    CacheKey original_key() const { return CacheKey(locator, TransformDescriptor::original()); }

    bool operator==(const CacheKey& other) const {
        return locator == other.locator && transform == other.transform;
    }
    bool operator!=(const CacheKey& other) const { return !(*this == other); }

    size_t hash() const;
};

struct CacheKeyHash {
    size_t operator()(const CacheKey& key) const { return key.hash(); }
};

/**
 * @brief Maps a locator to the filename prefix shared by all of its artifacts
 */
using UniqueNameFunction = std::function<std::string(const std::string& locator)>;

/**
 * @brief Default unique name: 64-bit FNV-1a of the locator, as 16 hex digits
 */
std::string default_unique_name(const std::string& locator);

/**
 * @brief Scheme for locators of caller-seeded content
 */
constexpr const char* USER_PROVIDED_SCHEME = "flightcache://";

/**
 * @brief Locator under which caller-seeded content with @p key is stored
 */
std::string user_provided_locator(const std::string& key);

bool is_user_provided_locator(const std::string& locator);

/**
 * @brief Recover the caller's key from a seeded-content locator
 */
std::optional<std::string> user_provided_key(const std::string& locator);

/**
 * @brief Percent-encode everything outside [A-Za-z0-9-._~], plus '/' if allowed
 */
std::string percent_encode(const std::string& value, bool keep_slash);

std::optional<std::string> percent_decode(const std::string& value);

} // namespace flightcache

namespace std {

template <>
struct hash<flightcache::CacheKey> {
    size_t operator()(const flightcache::CacheKey& key) const { return key.hash(); }
};

} // namespace std

#endif // FLIGHTCACHE_CACHE_KEY_HPP
