/**
 * @file disk_store.hpp
 * @brief Flat directory of cache artifacts with atomic writes and byte-budget trimming
 *
 * Artifacts are written to a hidden temporary file in the same directory and
 * then renamed into place, so readers see either the old file, the new file,
 * or nothing. Hidden files are never counted or deleted by trim().
 */

#ifndef FLIGHTCACHE_DISK_STORE_HPP
#define FLIGHTCACHE_DISK_STORE_HPP

#include "content/content.hpp"
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace flightcache {

/**
 * @brief Outcome of a byte-budget trim
 */
struct TrimResult {
    bool over_limit;            ///< True if the directory exceeded the limit before trimming
    size_t files_removed;
    uint64_t bytes_removed;
    uint64_t bytes_remaining;

    TrimResult() : over_limit(false), files_removed(0), bytes_removed(0), bytes_remaining(0) {}
};

/**
 * @brief Delete oldest-modified files until the directory fits in @p byte_limit
 *
 * Lists regular, non-hidden files with size and modification time. If their
 * total is within the limit nothing happens. Otherwise files are deleted
 * oldest first (ties keep listing order) until the running total is at or
 * below the limit. Individual deletion failures are ignored.
 */
TrimResult trim_directory(const std::filesystem::path& directory, uint64_t byte_limit);

class DiskStore {
public:
    /**
     * @param directory Cache directory; created if missing
     */
    explicit DiskStore(const std::filesystem::path& directory);

    const std::filesystem::path& directory() const { return directory_; }

    std::filesystem::path path_for(const std::string& filename) const { return directory_ / filename; }

    bool exists(const std::filesystem::path& path) const;

    /**
     * @brief Read a whole artifact
     * @return std::nullopt if the file is missing or unreadable
     */
    std::optional<Bytes> read(const std::filesystem::path& path) const;

    /**
     * @brief Atomically replace @p path with @p bytes
     *
     * @param error Receives a description of the failure, if non-null
     * @return false on failure; the previous file (if any) is left untouched
     */
    bool write(const std::filesystem::path& path, const Bytes& bytes, std::string* error = nullptr) const;

    /**
     * @brief Best-effort removal of one artifact
     */
    bool remove(const std::filesystem::path& path) const;

    TrimResult trim(uint64_t byte_limit) const { return trim_directory(directory_, byte_limit); }

    /**
     * @brief Remove and recreate the directory; safe to call repeatedly
     */
    bool remove_all() const;

    /**
     * @brief Total size of regular, non-hidden files
     */
    uint64_t total_size() const;

    bool ensure_directory() const;

private:
    std::filesystem::path directory_;
};

} // namespace flightcache

#endif // FLIGHTCACHE_DISK_STORE_HPP
