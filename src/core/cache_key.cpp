#include "core/cache_key.hpp"
#include <cctype>
#include <cmath>
#include <iomanip>
#include <sstream>

namespace flightcache {

namespace {

void hash_combine(size_t& seed, size_t value) {
    seed ^= value + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
}

void hash_combine(size_t& seed, double value) {
    // +0.0 and -0.0 compare equal, so they must hash equal
    hash_combine(seed, std::hash<double>()(value == 0.0 ? 0.0 : value));
}

void hash_combine(size_t& seed, const std::optional<Border>& border) {
    if (!border) {
        hash_combine(seed, static_cast<size_t>(0));
        return;
    }
    const Color& c = border->color;
    size_t packed = (static_cast<size_t>(c.r) << 24) | (static_cast<size_t>(c.g) << 16) |
                    (static_cast<size_t>(c.b) << 8) | static_cast<size_t>(c.a);
    hash_combine(seed, static_cast<size_t>(1));
    hash_combine(seed, packed);
}

// Truncates toward zero; values outside the integer range get a fixed token
std::string whole(double value) {
    if (std::isnan(value)) {
        return "nan";
    }
    if (value >= 9.2e18) {
        return "inf";
    }
    if (value <= -9.2e18) {
        return "-inf";
    }
    return std::to_string(static_cast<long long>(value));
}

std::string border_suffix(const std::optional<Border>& border) {
    if (!border) {
        return "nil";
    }
    std::ostringstream oss;
    oss << "hairline-" << std::hex << std::setfill('0')
        << std::setw(2) << static_cast<int>(border->color.r)
        << std::setw(2) << static_cast<int>(border->color.g)
        << std::setw(2) << static_cast<int>(border->color.b)
        << std::setw(2) << static_cast<int>(border->color.a);
    return oss.str();
}

const char* mode_name(ContentMode mode) {
    return mode == ContentMode::ScaleAspectFit ? "fit" : "fill";
}

} // namespace

TransformDescriptor TransformDescriptor::original() {
    return TransformDescriptor(OriginalTransform{});
}

TransformDescriptor TransformDescriptor::scaled(Size size, ContentMode mode, double bleed, bool opaque,
                                                double corner_radius, std::optional<Border> border,
                                                double content_scale) {
    ScaledTransform t;
    t.size = size;
    t.mode = mode;
    t.bleed = bleed;
    t.opaque = opaque;
    t.corner_radius = corner_radius;
    t.border = border;
    t.content_scale = content_scale;
    return TransformDescriptor(std::move(t));
}

TransformDescriptor TransformDescriptor::round(Size size, std::optional<Border> border, double content_scale) {
    RoundTransform t;
    t.size = size;
    t.border = border;
    t.content_scale = content_scale;
    return TransformDescriptor(std::move(t));
}

TransformDescriptor TransformDescriptor::custom(const std::string& edit_key,
                                                std::function<ContentPtr(const Content&)> block) {
    return TransformDescriptor(CustomTransform{edit_key, std::move(block)});
}

bool TransformDescriptor::operator==(const TransformDescriptor& other) const {
    if (value_.index() != other.value_.index()) {
        return false;
    }
    switch (kind()) {
        case Kind::Original:
            return true;
        case Kind::Scaled: {
            const auto& l = std::get<ScaledTransform>(value_);
            const auto& r = std::get<ScaledTransform>(other.value_);
            return l.size == r.size && l.mode == r.mode && l.bleed == r.bleed &&
                   l.opaque == r.opaque && l.corner_radius == r.corner_radius &&
                   l.border == r.border && l.content_scale == r.content_scale;
        }
        case Kind::Round: {
            const auto& l = std::get<RoundTransform>(value_);
            const auto& r = std::get<RoundTransform>(other.value_);
            return l.size == r.size && l.border == r.border && l.content_scale == r.content_scale;
        }
        case Kind::Custom:
            return std::get<CustomTransform>(value_).edit_key ==
                   std::get<CustomTransform>(other.value_).edit_key;
    }
    return false;
}

size_t TransformDescriptor::hash() const {
    size_t seed = value_.index();
    switch (kind()) {
        case Kind::Original:
            break;
        case Kind::Scaled: {
            const auto& t = std::get<ScaledTransform>(value_);
            hash_combine(seed, t.size.width);
            hash_combine(seed, t.size.height);
            hash_combine(seed, static_cast<size_t>(t.mode));
            hash_combine(seed, t.bleed);
            hash_combine(seed, static_cast<size_t>(t.opaque));
            hash_combine(seed, t.corner_radius);
            hash_combine(seed, t.border);
            hash_combine(seed, t.content_scale);
            break;
        }
        case Kind::Round: {
            const auto& t = std::get<RoundTransform>(value_);
            hash_combine(seed, t.size.width);
            hash_combine(seed, t.size.height);
            hash_combine(seed, t.border);
            hash_combine(seed, t.content_scale);
            break;
        }
        case Kind::Custom:
            hash_combine(seed, std::hash<std::string>()(std::get<CustomTransform>(value_).edit_key));
            break;
    }
    return seed;
}

std::string TransformDescriptor::disk_suffix() const {
    switch (kind()) {
        case Kind::Original:
            return "_original";
        case Kind::Scaled: {
            const auto& t = std::get<ScaledTransform>(value_);
            return "_scaled_" + whole(t.size.width) + "_" + whole(t.size.height) + "_" +
                   mode_name(t.mode) + "_" + whole(t.bleed) + "_" + (t.opaque ? "true" : "false") +
                   "_" + whole(t.corner_radius) + "_" + whole(t.content_scale) + "_" +
                   border_suffix(t.border);
        }
        case Kind::Round: {
            const auto& t = std::get<RoundTransform>(value_);
            return "_round_" + whole(t.size.width) + "_" + whole(t.size.height) + "_" +
                   border_suffix(t.border) + "_" + whole(t.content_scale);
        }
        case Kind::Custom:
            return "_custom_" + percent_encode(std::get<CustomTransform>(value_).edit_key, false);
    }
    return "_unknown";
}

std::string TransformDescriptor::to_string() const {
    std::ostringstream oss;
    switch (kind()) {
        case Kind::Original:
            oss << "original";
            break;
        case Kind::Scaled: {
            const auto& t = std::get<ScaledTransform>(value_);
            oss << "scaled(" << t.size.width << "x" << t.size.height << ", " << mode_name(t.mode);
            if (t.corner_radius > 0) oss << ", radius " << t.corner_radius;
            if (t.border) oss << ", " << border_suffix(t.border);
            oss << ")";
            break;
        }
        case Kind::Round: {
            const auto& t = std::get<RoundTransform>(value_);
            oss << "round(" << t.size.width << "x" << t.size.height << ")";
            break;
        }
        case Kind::Custom:
            oss << "custom(" << std::get<CustomTransform>(value_).edit_key << ")";
            break;
    }
    return oss.str();
}

size_t CacheKey::hash() const {
    size_t seed = std::hash<std::string>()(locator);
    hash_combine(seed, transform.hash());
    return seed;
}

std::string default_unique_name(const std::string& locator) {
    uint64_t hash = 0xcbf29ce484222325ULL;
    for (unsigned char c : locator) {
        hash ^= c;
        hash *= 0x100000001b3ULL;
    }
    std::ostringstream oss;
    oss << std::hex << std::setw(16) << std::setfill('0') << hash;
    return oss.str();
}

std::string percent_encode(const std::string& value, bool keep_slash) {
    std::ostringstream oss;
    oss << std::hex << std::uppercase << std::setfill('0');
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '.' || c == '_' || c == '~' || (keep_slash && c == '/')) {
            oss << static_cast<char>(c);
        } else {
            oss << '%' << std::setw(2) << static_cast<int>(c);
        }
    }
    return oss.str();
}

std::optional<std::string> percent_decode(const std::string& value) {
    std::string result;
    result.reserve(value.size());
    for (size_t i = 0; i < value.size(); ++i) {
        if (value[i] != '%') {
            result.push_back(value[i]);
            continue;
        }
        if (i + 2 >= value.size() ||
            !std::isxdigit(static_cast<unsigned char>(value[i + 1])) ||
            !std::isxdigit(static_cast<unsigned char>(value[i + 2]))) {
            return std::nullopt;
        }
        result.push_back(static_cast<char>(std::stoi(value.substr(i + 1, 2), nullptr, 16)));
        i += 2;
    }
    return result;
}

std::string user_provided_locator(const std::string& key) {
    return std::string(USER_PROVIDED_SCHEME) + percent_encode(key, true);
}

bool is_user_provided_locator(const std::string& locator) {
    return locator.compare(0, std::char_traits<char>::length(USER_PROVIDED_SCHEME), USER_PROVIDED_SCHEME) == 0;
}

std::optional<std::string> user_provided_key(const std::string& locator) {
    if (!is_user_provided_locator(locator)) {
        return std::nullopt;
    }
    return percent_decode(locator.substr(std::char_traits<char>::length(USER_PROVIDED_SCHEME)));
}

} // namespace flightcache
