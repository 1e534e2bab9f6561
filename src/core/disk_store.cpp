#include "core/disk_store.hpp"
#include <algorithm>
#include <atomic>
#include <fstream>
#include <iterator>
#include <sstream>
#include <system_error>
#include <thread>
#include <vector>
#include <unistd.h>

namespace fs = std::filesystem;

namespace flightcache {

namespace {

bool is_hidden(const fs::path& path) {
    const std::string name = path.filename().string();
    return !name.empty() && name[0] == '.';
}

struct Item {
    fs::path path;
    uint64_t size;
    fs::file_time_type modified;
};

std::vector<Item> list_items(const fs::path& directory) {
    std::vector<Item> items;
    std::error_code ec;
    fs::directory_iterator it(directory, ec);
    if (ec) {
        return items;
    }
    for (const auto& entry : it) {
        std::error_code entry_ec;
        if (!entry.is_regular_file(entry_ec) || entry_ec || is_hidden(entry.path())) {
            continue;
        }
        uint64_t size = entry.file_size(entry_ec);
        if (entry_ec) {
            continue;
        }
        auto modified = entry.last_write_time(entry_ec);
        if (entry_ec) {
            modified = fs::file_time_type::min();
        }
        items.push_back(Item{entry.path(), size, modified});
    }
    return items;
}

std::string temp_name_for(const fs::path& path) {
    static std::atomic<uint64_t> counter{0};
    std::ostringstream oss;
    oss << "." << path.filename().string() << ".tmp-" << ::getpid() << "-"
        << std::hash<std::thread::id>()(std::this_thread::get_id()) << "-" << counter.fetch_add(1);
    return oss.str();
}

} // namespace

TrimResult trim_directory(const fs::path& directory, uint64_t byte_limit) {
    TrimResult result;
    std::vector<Item> items = list_items(directory);

    uint64_t total = 0;
    for (const auto& item : items) {
        total += item.size;
    }
    result.bytes_remaining = total;

    if (total <= byte_limit) {
        return result;
    }
    result.over_limit = true;

    std::stable_sort(items.begin(), items.end(), [](const Item& a, const Item& b) {
        return a.modified < b.modified;
    });

    for (const auto& item : items) {
        if (total <= byte_limit) {
            break;
        }
        total -= item.size;
        std::error_code ec;
        if (fs::remove(item.path, ec) && !ec) {
            result.files_removed++;
            result.bytes_removed += item.size;
        }
    }

    result.bytes_remaining = total;
    return result;
}

DiskStore::DiskStore(const fs::path& directory)
    : directory_(directory)
{
    ensure_directory();
}

bool DiskStore::ensure_directory() const {
    std::error_code ec;
    fs::create_directories(directory_, ec);
    return !ec && fs::is_directory(directory_, ec);
}

bool DiskStore::exists(const fs::path& path) const {
    std::error_code ec;
    return fs::is_regular_file(path, ec) && !ec;
}

std::optional<Bytes> DiskStore::read(const fs::path& path) const {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return std::nullopt;
    }

    Bytes bytes((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (file.bad()) {
        return std::nullopt;
    }
    return bytes;
}

bool DiskStore::write(const fs::path& path, const Bytes& bytes, std::string* error) const {
    // The directory may have been cleared underneath us
    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);
    if (ec) {
        if (error) *error = "Failed to create directory: " + ec.message();
        return false;
    }

    const fs::path temp = path.parent_path() / temp_name_for(path);
    {
        std::ofstream file(temp, std::ios::binary | std::ios::trunc);
        if (!file.is_open()) {
            if (error) *error = "Failed to open temporary file " + temp.string();
            return false;
        }
        file.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
        file.flush();
        if (!file.good()) {
            file.close();
            fs::remove(temp, ec);
            if (error) *error = "Failed to write temporary file " + temp.string();
            return false;
        }
    }

    fs::rename(temp, path, ec);
    if (ec) {
        std::error_code remove_ec;
        fs::remove(temp, remove_ec);
        if (error) *error = "Failed to publish artifact: " + ec.message();
        return false;
    }
    return true;
}

bool DiskStore::remove(const fs::path& path) const {
    std::error_code ec;
    return fs::remove(path, ec) && !ec;
}

bool DiskStore::remove_all() const {
    std::error_code ec;
    fs::remove_all(directory_, ec);
    // A failed removal still leaves a usable directory behind
    return ensure_directory() && !ec;
}

uint64_t DiskStore::total_size() const {
    uint64_t total = 0;
    for (const auto& item : list_items(directory_)) {
        total += item.size;
    }
    return total;
}

} // namespace flightcache
