#ifndef UPLINK_CONFIG_UPDATER_CONFIG_HPP
#define UPLINK_CONFIG_UPDATER_CONFIG_HPP

#include "uplink/download/download_config.hpp"
#include "uplink/error/download_error.hpp"

#include <filesystem>
#include <string>

#include <nlohmann/json.hpp>

namespace uplink {

// ─────────────────────────────────────────────────────────────────────────────
// UpdaterConfig
// ─────────────────────────────────────────────────────────────────────────────
// The updater's settings file (config.json by default). load() creates the
// file with defaults on first run; unknown keys are ignored and missing keys
// keep their defaults, so older files keep loading after new settings are
// added.
//
//   {
//     "current_version": "1.2.0",
//     "update_check_url": "https://api.github.com/repos/owner/app/releases/latest",
//     "cache_directory": "update_cache",
//     "auto_check": true,
//     "last_check": "2026-01-01T00:00:00Z",
//     "log_level": "info",
//     "download": { "max_retries": 5, "backoff": { ... }, ... }
//   }

struct UpdaterConfig {
    static constexpr const char* kDefaultFileName = "config.json";

    std::string current_version{"0.0.0"};
    std::string update_check_url{"https://api.github.com/repos/owner/app/releases/latest"};
    std::filesystem::path cache_directory{"update_cache"};
    bool auto_check{true};
    std::string last_check;
    std::string log_level{"info"};

    DownloadConfig download;

    [[nodiscard]] static UpdaterConfig create_default();

    /// Read path, or write and return the defaults if it does not exist yet.
    [[nodiscard]] static DownloadResult<UpdaterConfig> load(const std::filesystem::path& path);

    DownloadResult<void> save(const std::filesystem::path& path) const;

    /// Set last_check to the current UTC time (RFC 3339).
    void touch_last_check();

    [[nodiscard]] nlohmann::json to_json() const;
    static DownloadResult<UpdaterConfig> from_json(const nlohmann::json& payload);
};

}  // namespace uplink

#endif  // UPLINK_CONFIG_UPDATER_CONFIG_HPP
