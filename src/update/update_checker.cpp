#include "uplink/update/update_checker.hpp"

#include "uplink/cache/cache_index.hpp"
#include "uplink/log/logger.hpp"
#include "uplink/update/version.hpp"

#include <array>
#include <stdexcept>

namespace uplink {

namespace {

// Archive formats in order of preference
constexpr std::array<std::array<std::string_view, 2>, 4> kArchiveSuffixes{{
    {".7z", ".7z"},
    {".zip", ".zip"},
    {".tar.gz", ".tgz"},
    {".tar.zst", ".tar.zstd"},
}};

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// Release feed
// ─────────────────────────────────────────────────────────────────────────────

std::string ReleaseInfo::version() const {
    return std::string(strip_version_prefix(tag_name));
}

DownloadResult<ReleaseInfo> ReleaseInfo::from_json(const nlohmann::json& payload) {
    if (payload.is_object() == false) {
        return tl::unexpected(DownloadError::parse("Release feed is not a JSON object"));
    }

    const auto tag = payload.find("tag_name");
    if (tag == payload.end() || tag->is_string() == false) {
        return tl::unexpected(DownloadError::parse("Release feed is missing tag_name"));
    }

    ReleaseInfo release;
    release.tag_name = tag->get<std::string>();

    const auto assets = payload.find("assets");
    if (assets == payload.end() || assets->is_array() == false) {
        return release;
    }

    for (const auto& node : *assets) {
        if (node.is_object() == false) {
            continue;
        }
        const auto name = node.find("name");
        const auto url = node.find("browser_download_url");
        if (name == node.end() || url == node.end() || !name->is_string() || !url->is_string()) {
            continue;
        }
        release.assets.push_back(ReleaseAsset{name->get<std::string>(), url->get<std::string>()});
    }
    return release;
}

std::optional<ReleaseAsset> select_archive_asset(const std::vector<ReleaseAsset>& assets) {
    for (const auto& suffixes : kArchiveSuffixes) {
        for (const auto& asset : assets) {
            if (asset.name.ends_with(suffixes[0]) || asset.name.ends_with(suffixes[1])) {
                return asset;
            }
        }
    }
    return std::nullopt;
}

nlohmann::json UpdateInfo::to_json() const {
    return nlohmann::json{
        {"current_version", current_version},
        {"latest_version", latest_version},
        {"download_url", download_url},
        {"asset_name", asset_name},
        {"update_available", update_available}
    };
}

// ─────────────────────────────────────────────────────────────────────────────
// UpdateChecker
// ─────────────────────────────────────────────────────────────────────────────

UpdateChecker::UpdateChecker(std::string user_agent)
    : UpdateChecker(std::move(user_agent), make_http_client())
{}

UpdateChecker::UpdateChecker(std::string user_agent, std::unique_ptr<IHttpClient> client)
    : client_(std::move(client))
{
    if (!client_) {
        throw std::invalid_argument("UpdateChecker: HTTP client cannot be null");
    }
    client_->set_default_headers(HeaderMap{
        {"User-Agent", std::move(user_agent)},
        {"Accept", "application/vnd.github+json"}
    });
}

DownloadResult<ReleaseInfo> UpdateChecker::fetch_latest_release(const std::string& feed_url) {
    if (!parse_url(feed_url).has_value()) {
        return tl::unexpected(DownloadError::configuration("Invalid update check URL: " + feed_url));
    }

    auto response = client_->get(feed_url);
    if (!response) {
        return tl::unexpected(DownloadError::from_client_error(response.error())
                                  .with_context("Failed to fetch latest release"));
    }

    if (response->is_success() == false) {
        return tl::unexpected(DownloadError{
            DownloadError::Code::HttpStatus,
            "Release feed returned status: " + response->head.status_text(),
            response->status_code()
        });
    }

    const auto payload = nlohmann::json::parse(response->body, nullptr, false);
    if (payload.is_discarded()) {
        return tl::unexpected(DownloadError::parse("Failed to parse release feed response"));
    }
    return ReleaseInfo::from_json(payload);
}

DownloadResult<UpdateInfo> UpdateChecker::check_for_updates(
    std::string_view current_version,
    const std::string& feed_url
) {
    auto release = fetch_latest_release(feed_url);
    if (!release) {
        return tl::unexpected(release.error());
    }

    UpdateInfo info;
    info.current_version = std::string(current_version);
    info.latest_version = release->version();

    if (const auto asset = select_archive_asset(release->assets); asset.has_value()) {
        info.download_url = asset->download_url;
        info.asset_name = asset->name;
    } else {
        UPLINK_LOG_WARN("Release {} has no supported archive asset", release->tag_name);
    }

    auto available = is_update_available(current_version, info.latest_version);
    if (!available) {
        return tl::unexpected(available.error());
    }
    info.update_available = *available;

    UPLINK_LOG_INFO("Current version {}, latest {}{}", info.current_version, info.latest_version,
                    info.update_available ? " (update available)" : "");
    return info;
}

DownloadResult<UpdateInfo> UpdateChecker::check_for_updates(const UpdaterConfig& config) {
    return check_for_updates(config.current_version, config.update_check_url);
}

}  // namespace uplink
