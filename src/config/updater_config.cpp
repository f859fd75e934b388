#include "uplink/config/updater_config.hpp"

#include "uplink/log/logger.hpp"

#include <chrono>
#include <format>
#include <fstream>

namespace uplink {

namespace {

DownloadError bad_setting(std::string_view key, std::string_view expected) {
    return DownloadError::configuration(
        std::format("Invalid config setting '{}': must be {}", key, expected));
}

DownloadResult<void> read_string(const nlohmann::json& payload, const char* key, std::string& out) {
    const auto it = payload.find(key);
    if (it == payload.end()) {
        return {};
    }
    if (it->is_string() == false) {
        return tl::unexpected(bad_setting(key, "a string"));
    }
    out = it->get<std::string>();
    return {};
}

}  // namespace

UpdaterConfig UpdaterConfig::create_default() {
    UpdaterConfig config;
    config.touch_last_check();
    return config;
}

void UpdaterConfig::touch_last_check() {
    const auto now = std::chrono::floor<std::chrono::seconds>(std::chrono::system_clock::now());
    last_check = std::format("{:%Y-%m-%dT%H:%M:%SZ}", now);
}

nlohmann::json UpdaterConfig::to_json() const {
    nlohmann::json payload = nlohmann::json::object();
    payload["current_version"] = current_version;
    payload["update_check_url"] = update_check_url;
    payload["cache_directory"] = cache_directory.string();
    payload["auto_check"] = auto_check;
    payload["last_check"] = last_check;
    payload["log_level"] = log_level;
    payload["download"] = download.to_json();
    return payload;
}

DownloadResult<UpdaterConfig> UpdaterConfig::from_json(const nlohmann::json& payload) {
    if (payload.is_object() == false) {
        return tl::unexpected(DownloadError::configuration("Invalid config: expected a JSON object"));
    }

    UpdaterConfig config;

    if (auto r = read_string(payload, "current_version", config.current_version); !r) {
        return tl::unexpected(r.error());
    }
    if (auto r = read_string(payload, "update_check_url", config.update_check_url); !r) {
        return tl::unexpected(r.error());
    }
    if (auto r = read_string(payload, "last_check", config.last_check); !r) {
        return tl::unexpected(r.error());
    }
    if (auto r = read_string(payload, "log_level", config.log_level); !r) {
        return tl::unexpected(r.error());
    }

    std::string cache_directory = config.cache_directory.string();
    if (auto r = read_string(payload, "cache_directory", cache_directory); !r) {
        return tl::unexpected(r.error());
    }
    config.cache_directory = cache_directory;

    if (const auto it = payload.find("auto_check"); it != payload.end()) {
        if (it->is_boolean() == false) {
            return tl::unexpected(bad_setting("auto_check", "a boolean"));
        }
        config.auto_check = it->get<bool>();
    }

    if (const auto it = payload.find("download"); it != payload.end()) {
        auto download = DownloadConfig::from_json(*it);
        if (!download) {
            return tl::unexpected(download.error());
        }
        config.download = std::move(*download);
    }

    return config;
}

DownloadResult<UpdaterConfig> UpdaterConfig::load(const std::filesystem::path& path) {
    std::error_code ec;
    if (std::filesystem::exists(path, ec) == false) {
        UPLINK_LOG_INFO("No config at {}, writing defaults", path.string());
        UpdaterConfig defaults = create_default();
        if (auto saved = defaults.save(path); !saved) {
            return tl::unexpected(saved.error());
        }
        return defaults;
    }

    std::ifstream input(path);
    if (input.is_open() == false) {
        return tl::unexpected(DownloadError::configuration("Failed to read " + path.string()));
    }

    const auto payload = nlohmann::json::parse(input, nullptr, false);
    if (payload.is_discarded()) {
        return tl::unexpected(DownloadError::configuration("Failed to parse " + path.string()));
    }

    auto config = from_json(payload);
    if (!config) {
        return tl::unexpected(std::move(config.error()).with_context("Failed to load " + path.string()));
    }
    return config;
}

DownloadResult<void> UpdaterConfig::save(const std::filesystem::path& path) const {
    if (path.has_parent_path()) {
        std::error_code ec;
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            return tl::unexpected(DownloadError::filesystem("Failed to create config directory", ec));
        }
    }

    std::ofstream output(path, std::ios::trunc);
    if (output.is_open() == false) {
        return tl::unexpected(DownloadError::filesystem("Failed to write " + path.string()));
    }
    output << to_json().dump(2) << '\n';
    if (!output) {
        return tl::unexpected(DownloadError::filesystem("Failed to write " + path.string()));
    }
    return {};
}

}  // namespace uplink
