#ifndef UPLINK_CACHE_CACHE_INDEX_HPP
#define UPLINK_CACHE_CACHE_INDEX_HPP

#include "uplink/error/download_error.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace uplink {

// ─────────────────────────────────────────────────────────────────────────────
// CacheEntry
// ─────────────────────────────────────────────────────────────────────────────

struct CacheEntry {
    std::string file_name;      // "v1.3.0_app.7z", relative to the cache dir
    std::string version;        // without leading 'v'
    std::string source_url;
    std::uint64_t size{0};
    bool completed{false};

    [[nodiscard]] nlohmann::json to_json() const;
    static DownloadResult<CacheEntry> from_json(const nlohmann::json& payload);
};

// ─────────────────────────────────────────────────────────────────────────────
// CacheIndex
// ─────────────────────────────────────────────────────────────────────────────
// Which version each file in the update cache belongs to, persisted as
// cache_index.json inside the cache directory. Downloads are named
// "v<version>_<original name>" so a partial file for one release is never
// resumed into another.
//
//   auto index = CacheIndex::open("update_cache");
//   auto path  = index->file_path("1.3.0", "app.7z");   // update_cache/v1.3.0_app.7z
//   ...
//   index->prune("1.3.0");   // drops every file not tagged 1.3.0
//
// Not thread-safe; the cache is owned by one updater process.

class CacheIndex {
public:
    static constexpr std::string_view kIndexFileName{"cache_index.json"};

    explicit CacheIndex(std::filesystem::path directory);

    /// Load the index from directory. A missing index yields an empty one;
    /// an unreadable or corrupt one is discarded with a warning.
    [[nodiscard]] static DownloadResult<CacheIndex> open(const std::filesystem::path& directory);

    /// "v<version>_<original name>", with any leading 'v' on version dropped.
    [[nodiscard]] static std::string cache_file_name(std::string_view version, std::string_view original_name);

    [[nodiscard]] std::filesystem::path file_path(std::string_view version, std::string_view original_name) const;

    [[nodiscard]] const std::filesystem::path& directory() const noexcept {
        return directory_;
    }

    [[nodiscard]] const std::vector<CacheEntry>& entries() const noexcept {
        return entries_;
    }

    [[nodiscard]] std::optional<CacheEntry> find(std::string_view file_name) const;

    /// Insert or replace by file_name, then save.
    DownloadResult<void> record(CacheEntry entry);

    /// Flag an entry as fully downloaded with its final size, then save.
    DownloadResult<void> mark_completed(std::string_view file_name, std::uint64_t size);

    /// Delete every cached file not tagged with current_version, including
    /// files the index does not know about. Returns the number of files removed.
    DownloadResult<std::size_t> prune(std::string_view current_version);

    /// Delete every cached file and empty the index.
    DownloadResult<std::size_t> clear();

    DownloadResult<void> save() const;

    [[nodiscard]] nlohmann::json to_json() const;

private:
    template <typename Keep>
    DownloadResult<std::size_t> remove_files(Keep keep);

    std::filesystem::path directory_;
    std::vector<CacheEntry> entries_;
};

/// "v1.3.0" -> "1.3.0"
[[nodiscard]] std::string_view strip_version_prefix(std::string_view version) noexcept;

}  // namespace uplink

#endif  // UPLINK_CACHE_CACHE_INDEX_HPP
