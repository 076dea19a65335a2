#include "runtime/package_cache.hpp"
#include "util/errors.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <openssl/evp.h>
#include <algorithm>
#include <cmath>
#include <fstream>
#include <system_error>

using json = nlohmann::json;
namespace fs = std::filesystem;

namespace warden::runtime {

namespace {

constexpr size_t KEY_LENGTH = 16;

bool is_cache_key(const std::string& key) {
    return key.size() == KEY_LENGTH &&
        std::all_of(key.begin(), key.end(), [](char c) {
            return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
        });
}

uint64_t directory_size(const fs::path& dir) {
    std::error_code ec;
    uint64_t total = 0;
    for (fs::recursive_directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        std::error_code size_ec;
        if (it->is_regular_file(size_ec)) {
            uint64_t size = it->file_size(size_ec);
            if (!size_ec) total += size;
        }
    }
    return total;
}

} // namespace

PackageCache::PackageCache(fs::path cache_dir, util::Clock clock)
    : dir_(std::move(cache_dir))
    , metadata_file_(dir_ / "cache-metadata.json")
    , clock_(std::move(clock))
    , metadata_(json::object()) {
    std::error_code ec;
    fs::create_directories(dir_, ec);
    if (ec) {
        spdlog::error("Failed to create package cache directory {}: {}", dir_.string(), ec.message());
    }
    load();
}

std::string PackageCache::cache_key(const std::vector<std::string>& packages,
                                    const std::string& language) {
    std::vector<std::string> sorted = packages;
    std::sort(sorted.begin(), sorted.end());
    std::string content = json{{"language", language}, {"packages", sorted}}.dump();

    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    if (EVP_Digest(content.data(), content.size(), digest, &length, EVP_sha256(), nullptr) != 1) {
        throw Error("SHA-256 digest failed");
    }

    std::string key;
    for (unsigned int i = 0; i < length && key.size() < KEY_LENGTH; ++i) {
        key += fmt::format("{:02x}", digest[i]);
    }
    return key;
}

bool PackageCache::is_cached(const std::vector<std::string>& packages,
                             const std::string& language) const {
    if (packages.empty()) {
        return true;
    }
    std::string key = cache_key(packages, language);
    std::lock_guard<std::mutex> lock(mutex_);
    if (!metadata_.contains(key)) {
        return false;
    }
    std::error_code ec;
    return fs::is_directory(dir_ / key, ec);
}

std::optional<fs::path> PackageCache::cache_path(const std::vector<std::string>& packages,
                                                 const std::string& language) const {
    if (!is_cached(packages, language)) {
        return std::nullopt;
    }
    return dir_ / cache_key(packages, language);
}

std::string PackageCache::register_cache(const std::vector<std::string>& packages,
                                         const std::string& language,
                                         const std::string& container_id,
                                         uint64_t size_bytes) {
    std::string key = cache_key(packages, language);
    std::vector<std::string> sorted = packages;
    std::sort(sorted.begin(), sorted.end());

    std::error_code ec;
    fs::create_directories(dir_ / key, ec);
    if (ec) {
        spdlog::error("Failed to create cache entry {}: {}", key, ec.message());
    }

    std::lock_guard<std::mutex> lock(mutex_);
    metadata_[key] = {
        {"language", language},
        {"packages", sorted},
        {"container_id", container_id.empty() ? json() : json(container_id)},
        {"size_bytes", size_bytes},
        {"created_at", clock_()}
    };
    if (!save()) {
        spdlog::warn("Package cache {} is recorded in memory only", key);
    }
    spdlog::info("Registered package cache {} ({} packages)", key, sorted.size());
    return key;
}

bool PackageCache::invalidate(const std::string& key) {
    if (!is_cache_key(key)) {
        spdlog::warn("Refusing to invalidate malformed cache key {}", key);
        return false;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    std::error_code ec;
    fs::remove_all(dir_ / key, ec);
    if (ec) {
        spdlog::error("Failed to invalidate package cache {}: {}", key, ec.message());
        return false;
    }
    if (metadata_.erase(key) > 0 && !save()) {
        return false;
    }
    spdlog::info("Invalidated package cache {}", key);
    return true;
}

bool PackageCache::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    bool ok = true;
    for (auto it = metadata_.begin(); it != metadata_.end(); ++it) {
        std::error_code ec;
        fs::remove_all(dir_ / it.key(), ec);
        if (ec) {
            spdlog::error("Failed to remove package cache {}: {}", it.key(), ec.message());
            ok = false;
        }
    }
    metadata_ = json::object();
    if (!save()) {
        return false;
    }
    spdlog::info("Package cache cleared");
    return ok;
}

json PackageCache::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    uint64_t total = 0;
    for (auto it = metadata_.begin(); it != metadata_.end(); ++it) {
        total += directory_size(dir_ / it.key());
    }
    double mb = std::round(static_cast<double>(total) / (1024.0 * 1024.0) * 100.0) / 100.0;
    return {
        {"entry_count", metadata_.size()},
        {"total_size_bytes", total},
        {"total_size_mb", mb},
        {"cache_dir", dir_.string()}
    };
}

size_t PackageCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return metadata_.size();
}

void PackageCache::load() {
    std::ifstream file(metadata_file_);
    if (!file.is_open()) {
        return;
    }
    try {
        json data = json::parse(file);
        if (data.is_object()) {
            metadata_ = std::move(data);
        } else {
            spdlog::error("Package cache metadata {} is not an object", metadata_file_.string());
        }
    } catch (const json::parse_error& e) {
        spdlog::error("Failed to load package cache metadata {}: {}", metadata_file_.string(), e.what());
    }
}

bool PackageCache::save() const {
    std::ofstream file(metadata_file_, std::ios::trunc);
    if (!file.is_open()) {
        spdlog::error("Failed to save package cache metadata {}", metadata_file_.string());
        return false;
    }
    file << metadata_.dump(2);
    if (!file) {
        spdlog::error("Failed to write package cache metadata {}", metadata_file_.string());
        return false;
    }
    return true;
}

} // namespace warden::runtime
