/**
 * Package set cache index
 *
 * Remembers which package sets have already been installed into a
 * reusable layer. A set is keyed by the SHA-256 of its language and
 * sorted package list; each key owns a directory under the cache root
 * and an entry in cache-metadata.json.
 */
#pragma once
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "util/clock.hpp"

namespace warden::runtime {

class PackageCache {
public:
    explicit PackageCache(std::filesystem::path cache_dir = "/tmp/executor-cache",
                          util::Clock clock = util::wall_seconds);

    // Non-copyable
    PackageCache(const PackageCache&) = delete;
    PackageCache& operator=(const PackageCache&) = delete;

    // 16 hex characters; independent of package order
    static std::string cache_key(const std::vector<std::string>& packages,
                                 const std::string& language = "python");

    // An empty set is always cached
    bool is_cached(const std::vector<std::string>& packages,
                   const std::string& language = "python") const;
    std::optional<std::filesystem::path> cache_path(const std::vector<std::string>& packages,
                                                    const std::string& language = "python") const;

    // Creates the key directory and records the entry; returns the key
    std::string register_cache(const std::vector<std::string>& packages,
                               const std::string& language = "python",
                               const std::string& container_id = "",
                               uint64_t size_bytes = 0);

    bool invalidate(const std::string& key);
    bool clear();

    // entry_count, total_size_bytes, total_size_mb, cache_dir
    nlohmann::json stats() const;

    size_t size() const;

private:
    std::filesystem::path dir_;
    std::filesystem::path metadata_file_;
    util::Clock clock_;

    mutable std::mutex mutex_;
    nlohmann::json metadata_;

    void load();
    bool save() const;
};

} // namespace warden::runtime
