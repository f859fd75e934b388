#include "uplink/cache/cache_index.hpp"

#include "uplink/log/logger.hpp"

#include <algorithm>
#include <fstream>

namespace uplink {

namespace {

DownloadError bad_entry(std::string_view what) {
    return DownloadError::parse("Invalid cache index entry: " + std::string(what));
}

}  // namespace

std::string_view strip_version_prefix(std::string_view version) noexcept {
    if (!version.empty() && (version.front() == 'v' || version.front() == 'V')) {
        version.remove_prefix(1);
    }
    return version;
}

// ─────────────────────────────────────────────────────────────────────────────
// CacheEntry
// ─────────────────────────────────────────────────────────────────────────────

nlohmann::json CacheEntry::to_json() const {
    return nlohmann::json{
        {"file_name", file_name},
        {"version", version},
        {"source_url", source_url},
        {"size", size},
        {"completed", completed}
    };
}

DownloadResult<CacheEntry> CacheEntry::from_json(const nlohmann::json& payload) {
    if (payload.is_object() == false) {
        return tl::unexpected(bad_entry("expected an object"));
    }

    const auto file_name = payload.find("file_name");
    if (file_name == payload.end() || file_name->is_string() == false) {
        return tl::unexpected(bad_entry("missing file_name"));
    }
    const auto version = payload.find("version");
    if (version == payload.end() || version->is_string() == false) {
        return tl::unexpected(bad_entry("missing version"));
    }

    CacheEntry entry;
    entry.file_name = file_name->get<std::string>();
    entry.version = version->get<std::string>();
    entry.source_url = payload.value("source_url", std::string{});
    if (const auto size = payload.find("size"); size != payload.end() && size->is_number_integer()) {
        entry.size = size->get<std::uint64_t>();
    }
    entry.completed = payload.value("completed", false);
    return entry;
}

// ─────────────────────────────────────────────────────────────────────────────
// CacheIndex
// ─────────────────────────────────────────────────────────────────────────────

CacheIndex::CacheIndex(std::filesystem::path directory)
    : directory_(std::move(directory))
{}

DownloadResult<CacheIndex> CacheIndex::open(const std::filesystem::path& directory) {
    CacheIndex index(directory);

    const auto index_path = directory / kIndexFileName;
    std::error_code ec;
    if (std::filesystem::exists(index_path, ec) == false) {
        return index;
    }

    std::ifstream input(index_path);
    if (input.is_open() == false) {
        return tl::unexpected(DownloadError::filesystem("Failed to open cache index " + index_path.string()));
    }

    const auto payload = nlohmann::json::parse(input, nullptr, false);
    if (payload.is_discarded() || payload.is_object() == false) {
        UPLINK_LOG_WARN("Discarding corrupt cache index {}", index_path.string());
        return index;
    }

    const auto entries = payload.find("entries");
    if (entries == payload.end() || entries->is_array() == false) {
        UPLINK_LOG_WARN("Discarding cache index without entries: {}", index_path.string());
        return index;
    }

    for (const auto& node : *entries) {
        auto entry = CacheEntry::from_json(node);
        if (!entry) {
            UPLINK_LOG_WARN("Skipping cache index entry: {}", entry.error().message());
            continue;
        }
        index.entries_.push_back(std::move(*entry));
    }
    return index;
}

std::string CacheIndex::cache_file_name(std::string_view version, std::string_view original_name) {
    std::string name = "v";
    name += strip_version_prefix(version);
    name += '_';
    name += original_name;
    return name;
}

std::filesystem::path CacheIndex::file_path(std::string_view version, std::string_view original_name) const {
    return directory_ / cache_file_name(version, original_name);
}

std::optional<CacheEntry> CacheIndex::find(std::string_view file_name) const {
    const auto it = std::ranges::find_if(entries_, [file_name](const CacheEntry& entry) {
        return entry.file_name == file_name;
    });
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return *it;
}

DownloadResult<void> CacheIndex::record(CacheEntry entry) {
    entry.version = std::string(strip_version_prefix(entry.version));

    auto it = std::ranges::find_if(entries_, [&entry](const CacheEntry& existing) {
        return existing.file_name == entry.file_name;
    });
    if (it != entries_.end()) {
        *it = std::move(entry);
    } else {
        entries_.push_back(std::move(entry));
    }
    return save();
}

DownloadResult<void> CacheIndex::mark_completed(std::string_view file_name, std::uint64_t size) {
    auto it = std::ranges::find_if(entries_, [file_name](const CacheEntry& entry) {
        return entry.file_name == file_name;
    });
    if (it == entries_.end()) {
        return tl::unexpected(DownloadError::validation(
            "Cache entry not found: " + std::string(file_name)));
    }
    it->size = size;
    it->completed = true;
    return save();
}

template <typename Keep>
DownloadResult<std::size_t> CacheIndex::remove_files(Keep keep) {
    std::error_code ec;
    if (std::filesystem::exists(directory_, ec) == false) {
        entries_.clear();
        return std::size_t{0};
    }

    std::vector<std::filesystem::path> doomed;
    std::filesystem::directory_iterator it(directory_, ec);
    for (; !ec && it != std::filesystem::directory_iterator{}; it.increment(ec)) {
        std::error_code type_ec;
        if (it->is_regular_file(type_ec) == false) {
            continue;
        }
        const auto name = it->path().filename().string();
        if (name == kIndexFileName || keep(name)) {
            continue;
        }
        doomed.push_back(it->path());
    }
    if (ec) {
        return tl::unexpected(DownloadError::filesystem("Failed to read cache directory", ec));
    }

    std::size_t removed = 0;
    for (const auto& path : doomed) {
        std::error_code remove_ec;
        std::filesystem::remove(path, remove_ec);
        if (remove_ec) {
            UPLINK_LOG_WARN("Failed to remove cached file {}: {}", path.string(), remove_ec.message());
            continue;
        }
        UPLINK_LOG_DEBUG("Removed cached file {}", path.string());
        ++removed;
    }

    // keep() may look entries up, so decide before touching entries_
    std::vector<CacheEntry> kept;
    for (const auto& entry : entries_) {
        if (keep(entry.file_name)) {
            kept.push_back(entry);
        }
    }
    entries_ = std::move(kept);

    if (auto saved = save(); !saved) {
        return tl::unexpected(saved.error());
    }
    return removed;
}

DownloadResult<std::size_t> CacheIndex::prune(std::string_view current_version) {
    const std::string current(strip_version_prefix(current_version));
    UPLINK_LOG_INFO("Pruning update cache {} (keeping version {})", directory_.string(), current);

    return remove_files([this, &current](const std::string& file_name) {
        const auto entry = find(file_name);
        return entry.has_value() && entry->version == current;
    });
}

DownloadResult<std::size_t> CacheIndex::clear() {
    UPLINK_LOG_INFO("Clearing update cache {}", directory_.string());
    return remove_files([](const std::string& /*file_name*/) { return false; });
}

nlohmann::json CacheIndex::to_json() const {
    nlohmann::json entries = nlohmann::json::array();
    for (const auto& entry : entries_) {
        entries.push_back(entry.to_json());
    }
    return nlohmann::json{{"entries", std::move(entries)}};
}

DownloadResult<void> CacheIndex::save() const {
    std::error_code ec;
    std::filesystem::create_directories(directory_, ec);
    if (ec) {
        return tl::unexpected(DownloadError::filesystem("Failed to create cache directory", ec));
    }

    const auto index_path = directory_ / kIndexFileName;
    auto temp_path = index_path;
    temp_path += ".tmp";

    {
        std::ofstream output(temp_path, std::ios::trunc);
        if (output.is_open() == false) {
            return tl::unexpected(DownloadError::filesystem("Failed to write cache index " + temp_path.string()));
        }
        output << to_json().dump(2);
        if (!output) {
            return tl::unexpected(DownloadError::filesystem("Failed to write cache index " + temp_path.string()));
        }
    }

    std::filesystem::rename(temp_path, index_path, ec);
    if (ec) {
        return tl::unexpected(DownloadError::filesystem("Failed to replace cache index", ec));
    }
    return {};
}

}  // namespace uplink
