#ifndef FLIGHTCACHE_DOWNLOAD_RESULT_HPP
#define FLIGHTCACHE_DOWNLOAD_RESULT_HPP

#include "content/content.hpp"
#include <filesystem>
#include <memory>

namespace flightcache {

/**
 * @brief Output of the download stage
 *
 * Either freshly fetched bytes or the contents of an original artifact that
 * was already on disk, read by the download stage so a later delete of the
 * file cannot fail the format stage. Copies share the bytes.
 */
class DownloadResult {
public:
    enum class Kind {
        Fresh,      ///< Bytes fetched from the network during this task
        Previous    ///< Original artifact found on disk
    };

    static DownloadResult fresh(Bytes bytes) {
        DownloadResult result(Kind::Fresh);
        result.bytes_ = std::make_shared<const Bytes>(std::move(bytes));
        return result;
    }

    static DownloadResult previous(std::filesystem::path path, Bytes bytes) {
        DownloadResult result(Kind::Previous);
        result.path_ = std::move(path);
        result.bytes_ = std::make_shared<const Bytes>(std::move(bytes));
        return result;
    }

    Kind kind() const { return kind_; }

    bool is_fresh() const { return kind_ == Kind::Fresh; }

    /**
     * @brief Source bytes, fetched or read from the original artifact
     */
    const Bytes& bytes() const {
        static const Bytes empty;
        return bytes_ ? *bytes_ : empty;
    }

    /**
     * @brief Original artifact path; empty for Fresh results
     */
    const std::filesystem::path& path() const { return path_; }

private:
    explicit DownloadResult(Kind kind) : kind_(kind) {}

    Kind kind_;
    std::shared_ptr<const Bytes> bytes_;
    std::filesystem::path path_;
};

} // namespace flightcache

#endif // FLIGHTCACHE_DOWNLOAD_RESULT_HPP
