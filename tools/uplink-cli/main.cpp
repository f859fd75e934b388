// ─────────────────────────────────────────────────────────────────────────────
// uplink-cli - Update Download Tool
// ─────────────────────────────────────────────────────────────────────────────
// Command-line front-end for the uplink download engine.
//
// Usage:
//   # Compare the configured version against the release feed
//   uplink-cli --config config.json --check
//
//   # Check, then download the newest archive into the update cache
//   uplink-cli --config config.json --fetch-update
//
//   # Download any URL, resuming a partial file if present
//   uplink-cli --download https://example.com/app-1.3.0.7z --output app.7z --resume
//
//   # Show how an error message would be presented to the user
//   uplink-cli --classify "Failed to read download chunk | Connection reset by peer"
//
//   # Cache maintenance
//   uplink-cli --prune-cache
//   uplink-cli --clear-cache
//
// Test hooks: UPLINK_MAX_BPS caps throughput, UPLINK_FAIL_PCT injects
// connection resets into a percentage of chunks.

#include <cxxopts.hpp>
#include <nlohmann/json.hpp>

#include "uplink/cache/cache_index.hpp"
#include "uplink/config/updater_config.hpp"
#include "uplink/error/error_classifier.hpp"
#include "uplink/log/logger.hpp"
#include "uplink/log/spdlog_logger.hpp"
#include "uplink/service/download_service.hpp"
#include "uplink/update/update_checker.hpp"

#include <cstdio>
#include <format>
#include <iostream>
#include <string>

using namespace uplink;
using Json = nlohmann::json;

// ═══════════════════════════════════════════════════════════════════════════
// ANSI Color Codes
// ═══════════════════════════════════════════════════════════════════════════

namespace color {
    const char* reset   = "\033[0m";
    const char* bold    = "\033[1m";
    const char* dim     = "\033[2m";
    const char* red     = "\033[31m";
    const char* green   = "\033[32m";
    const char* yellow  = "\033[33m";

    bool enabled = true;

    std::string c(const char* code) {
        return enabled ? code : "";
    }
}

// ═══════════════════════════════════════════════════════════════════════════
// Output Helpers
// ═══════════════════════════════════════════════════════════════════════════

void print_error(const std::string& msg) {
    std::cerr << color::c(color::red) << "Error: " << msg << color::c(color::reset) << "\n";
}

void print_json(const Json& j) {
    std::cout << j.dump(2) << "\n";
}

void print_failure(const DownloadError& error, bool json_output) {
    const auto verdict = ErrorClassifier::classify(error);
    if (json_output) {
        print_json(verdict.to_json());
        return;
    }
    print_error(verdict.user_message);
    std::cerr << color::c(color::dim) << "  " << verdict.technical_details << "\n"
              << "  " << verdict.recovery_suggestion << color::c(color::reset) << "\n";
}

// Single-line progress display, redrawn in place on stderr.
class ProgressLine final : public IProgressObserver {
public:
    void on_progress(const ProgressSample& sample) override {
        if (sample.is_retrying) {
            std::cerr << "\r\033[K" << color::c(color::yellow)
                      << std::format("Retry {}: {}", sample.retry_count, sample.retry_reason)
                      << color::c(color::reset) << "\n";
            return;
        }

        const double mib = static_cast<double>(sample.downloaded) / (1024.0 * 1024.0);
        if (sample.total > 0) {
            const double total_mib = static_cast<double>(sample.total) / (1024.0 * 1024.0);
            std::cerr << std::format("\r\033[K{:5.1f}%  {:.1f}/{:.1f} MiB  {:.2f} MB/s",
                                     sample.percentage, mib, total_mib, sample.speed);
        } else {
            std::cerr << std::format("\r\033[K{:.1f} MiB  {:.2f} MB/s", mib, sample.speed);
        }
        std::cerr.flush();
        drawn_ = true;
    }

    void finish() {
        if (drawn_) {
            std::cerr << "\n";
        }
    }

private:
    bool drawn_{false};
};

// ═══════════════════════════════════════════════════════════════════════════
// Command Handlers
// ═══════════════════════════════════════════════════════════════════════════

int cmd_check(UpdaterConfig& config, const std::string& config_path, bool json_output) {
    UpdateChecker checker(config.download.user_agent);
    auto info = checker.check_for_updates(config);
    if (!info) {
        print_failure(info.error(), json_output);
        return 1;
    }

    config.touch_last_check();
    if (auto saved = config.save(config_path); !saved) {
        UPLINK_LOG_WARN("Could not record last check time: {}", saved.error().chain());
    }

    if (json_output) {
        print_json(info->to_json());
        return 0;
    }

    if (info->update_available) {
        std::cout << color::c(color::green) << color::c(color::bold)
                  << "Update available: " << info->current_version << " -> " << info->latest_version
                  << color::c(color::reset) << "\n";
        if (!info->download_url.empty()) {
            std::cout << "  " << info->asset_name << "\n  " << color::c(color::dim)
                      << info->download_url << color::c(color::reset) << "\n";
        }
    } else {
        std::cout << "Up to date (" << info->current_version << ")\n";
    }
    return 0;
}

int cmd_fetch_update(const UpdaterConfig& config, bool json_output) {
    UpdateChecker checker(config.download.user_agent);
    auto info = checker.check_for_updates(config);
    if (!info) {
        print_failure(info.error(), json_output);
        return 1;
    }
    if (info->update_available == false) {
        std::cout << "Up to date (" << info->current_version << ")\n";
        return 0;
    }

    auto index = CacheIndex::open(config.cache_directory);
    if (!index) {
        print_failure(index.error(), json_output);
        return 1;
    }

    DownloadService service(config.download);
    ProgressLine progress;
    auto path = service.fetch_update(*info, *index, progress);
    progress.finish();
    if (!path) {
        print_failure(path.error(), json_output);
        return 1;
    }

    if (json_output) {
        print_json(Json{{"path", path->string()}, {"version", info->latest_version}});
    } else {
        std::cout << color::c(color::green) << "Downloaded " << info->latest_version << " to "
                  << path->string() << color::c(color::reset) << "\n";
    }
    return 0;
}

int cmd_download(
    const UpdaterConfig& config,
    const std::string& url,
    std::string output,
    bool resume,
    bool json_output
) {
    if (output.empty()) {
        const auto components = parse_url(url);
        if (!components.has_value() || components->file_name().empty()) {
            print_error("Cannot derive a file name from the URL; pass --output");
            return 1;
        }
        output = (config.cache_directory / components->file_name()).string();
    }

    DownloadService service(config.download);
    ProgressLine progress;

    DownloadRequest request;
    request.url = url;
    request.destination = output;
    request.resume = resume;

    auto path = service.fetch(request, progress);
    progress.finish();
    if (!path) {
        print_failure(path.error(), json_output);
        return 1;
    }

    if (json_output) {
        print_json(Json{{"path", path->string()}});
    } else {
        std::cout << color::c(color::green) << "Saved " << path->string() << color::c(color::reset) << "\n";
    }
    return 0;
}

int cmd_classify(const std::string& message) {
    print_json(ErrorClassifier::classify(message).to_json());
    return 0;
}

int cmd_prune_cache(const UpdaterConfig& config, bool clear_all) {
    auto index = CacheIndex::open(config.cache_directory);
    if (!index) {
        print_error(index.error().chain());
        return 1;
    }

    auto removed = clear_all ? index->clear() : index->prune(config.current_version);
    if (!removed) {
        print_error(removed.error().chain());
        return 1;
    }
    std::cout << "Removed " << *removed << " cached file(s) from " << config.cache_directory.string() << "\n";
    return 0;
}

// ═══════════════════════════════════════════════════════════════════════════
// Main
// ═══════════════════════════════════════════════════════════════════════════

int main(int argc, char* argv[]) {
    cxxopts::Options options("uplink-cli", "Resumable update downloader");

    options.add_options()
        // Configuration
        ("c,config", "Updater settings file", cxxopts::value<std::string>()->default_value(UpdaterConfig::kDefaultFileName))

        // Commands
        ("check", "Check the release feed for a newer version")
        ("fetch-update", "Check, then download the newest release archive into the cache")
        ("d,download", "Download a URL", cxxopts::value<std::string>())
        ("o,output", "Destination for --download (default: cache directory)", cxxopts::value<std::string>()->default_value(""))
        ("r,resume", "Resume a partial --download destination")
        ("classify", "Classify an error message and print the verdict", cxxopts::value<std::string>())
        ("prune-cache", "Remove cached files not belonging to the current version")
        ("clear-cache", "Remove every cached file")

        // Output options
        ("j,json", "Output results as JSON")
        ("no-color", "Disable colored output")
        ("log-file", "Also write logs to this file", cxxopts::value<std::string>())
        ("v,verbose", "Enable verbose logging")
        ("h,help", "Print usage");

    try {
        auto result = options.parse(argc, argv);

        if (result.count("help")) {
            std::cout << options.help() << "\n";
            return 0;
        }

        color::enabled = !result.count("no-color");
        const bool json_output = result.count("json") > 0;

        // classify needs no config or network
        if (result.count("classify")) {
            return cmd_classify(result["classify"].as<std::string>());
        }

        const auto config_path = result["config"].as<std::string>();
        auto config = UpdaterConfig::load(config_path);
        if (!config) {
            print_error(config.error().chain());
            return 1;
        }
        config->download.apply_environment();

        LogLevel level = log_level_from_string(config->log_level);
        if (result.count("verbose")) {
            level = LogLevel::Debug;
        }
        if (result.count("log-file")) {
            set_logger(make_spdlog_console_file_logger(result["log-file"].as<std::string>(), level));
        } else {
            set_logger(make_spdlog_console_logger(level));
        }

        if (result.count("check")) {
            return cmd_check(*config, config_path, json_output);
        }
        if (result.count("fetch-update")) {
            return cmd_fetch_update(*config, json_output);
        }
        if (result.count("download")) {
            return cmd_download(*config, result["download"].as<std::string>(),
                                result["output"].as<std::string>(), result.count("resume") > 0,
                                json_output);
        }
        if (result.count("clear-cache")) {
            return cmd_prune_cache(*config, true);
        }
        if (result.count("prune-cache")) {
            return cmd_prune_cache(*config, false);
        }

        std::cout << options.help() << "\n";
        return 1;

    } catch (const cxxopts::exceptions::exception& e) {
        print_error(e.what());
        return 1;
    }
}
