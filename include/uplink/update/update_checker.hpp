#ifndef UPLINK_UPDATE_UPDATE_CHECKER_HPP
#define UPLINK_UPDATE_UPDATE_CHECKER_HPP

#include "uplink/config/updater_config.hpp"
#include "uplink/error/download_error.hpp"
#include "uplink/transport/http_client.hpp"

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace uplink {

// ─────────────────────────────────────────────────────────────────────────────
// Release feed
// ─────────────────────────────────────────────────────────────────────────────
// GitHub "latest release" shape; every other field is ignored:
//
//   { "tag_name": "v1.3.0",
//     "assets": [ { "name": "app-1.3.0.7z",
//                   "browser_download_url": "https://..." } ] }

struct ReleaseAsset {
    std::string name;
    std::string download_url;
};

struct ReleaseInfo {
    std::string tag_name;
    std::vector<ReleaseAsset> assets;

    /// tag_name without its leading 'v'
    [[nodiscard]] std::string version() const;

    static DownloadResult<ReleaseInfo> from_json(const nlohmann::json& payload);
};

/// Preferred archive: .7z, then .zip, then .tar.gz / .tgz, then
/// .tar.zst / .tar.zstd. nullopt if the release has none of these.
[[nodiscard]] std::optional<ReleaseAsset> select_archive_asset(const std::vector<ReleaseAsset>& assets);

// ─────────────────────────────────────────────────────────────────────────────
// UpdateInfo
// ─────────────────────────────────────────────────────────────────────────────

struct UpdateInfo {
    std::string current_version;
    std::string latest_version;     // without leading 'v'
    std::string download_url;       // empty when no archive asset was found
    std::string asset_name;
    bool update_available{false};

    [[nodiscard]] nlohmann::json to_json() const;
};

// ─────────────────────────────────────────────────────────────────────────────
// UpdateChecker
// ─────────────────────────────────────────────────────────────────────────────

class UpdateChecker {
public:
    explicit UpdateChecker(std::string user_agent = "uplink-updater/1.0");

    UpdateChecker(std::string user_agent, std::unique_ptr<IHttpClient> client);

    [[nodiscard]] DownloadResult<ReleaseInfo> fetch_latest_release(const std::string& feed_url);

    [[nodiscard]] DownloadResult<UpdateInfo> check_for_updates(
        std::string_view current_version,
        const std::string& feed_url
    );

    [[nodiscard]] DownloadResult<UpdateInfo> check_for_updates(const UpdaterConfig& config);

private:
    std::unique_ptr<IHttpClient> client_;
};

}  // namespace uplink

#endif  // UPLINK_UPDATE_UPDATE_CHECKER_HPP
