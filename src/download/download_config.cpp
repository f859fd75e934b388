#include "uplink/download/download_config.hpp"

#include "uplink/log/logger.hpp"

#include <algorithm>
#include <charconv>
#include <cstdlib>
#include <format>
#include <string_view>

namespace uplink {

namespace {

template <typename T>
std::optional<T> parse_env_number(const char* name) {
    const char* raw = std::getenv(name);
    if (raw == nullptr) {
        return std::nullopt;
    }

    const std::string_view text(raw);
    T value{};
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        UPLINK_LOG_WARN("Ignoring {}={}: not a number", name, text);
        return std::nullopt;
    }
    return value;
}

bool is_non_negative_integer(const nlohmann::json& node) {
    if (node.is_number_unsigned()) {
        return true;
    }
    return node.is_number_integer() && node.get<std::int64_t>() >= 0;
}

DownloadError bad_field(std::string_view key, std::string_view expected) {
    return DownloadError::configuration(
        std::format("Invalid download config: '{}' must be {}", key, expected));
}

// Reads payload[key] into out when present. Absent keys are not an error.
DownloadResult<void> read_millis(const nlohmann::json& payload,
                                 std::string_view key,
                                 std::chrono::milliseconds& out) {
    const auto it = payload.find(std::string(key));
    if (it == payload.end()) {
        return {};
    }
    if (is_non_negative_integer(*it) == false) {
        return tl::unexpected(bad_field(key, "a non-negative integer"));
    }
    out = std::chrono::milliseconds{it->get<std::int64_t>()};
    return {};
}

DownloadResult<BackoffConfig> parse_backoff(const nlohmann::json& node, BackoffConfig backoff) {
    if (node.is_object() == false) {
        return tl::unexpected(bad_field("backoff", "an object"));
    }

    if (const auto it = node.find("strategy"); it != node.end()) {
        if (it->is_string() == false) {
            return tl::unexpected(bad_field("backoff.strategy", "a string"));
        }
        const auto strategy = backoff_strategy_from_string(it->get<std::string>());
        if (strategy.has_value() == false) {
            return tl::unexpected(bad_field("backoff.strategy", "exponential, linear or fixed"));
        }
        backoff.strategy = *strategy;
    }

    if (auto r = read_millis(node, "base_ms", backoff.base); !r) {
        return tl::unexpected(r.error());
    }
    if (auto r = read_millis(node, "increment_ms", backoff.increment); !r) {
        return tl::unexpected(r.error());
    }
    if (auto r = read_millis(node, "max_ms", backoff.max); !r) {
        return tl::unexpected(r.error());
    }

    if (const auto it = node.find("multiplier"); it != node.end()) {
        if (it->is_number() == false || it->get<double>() < 1.0) {
            return tl::unexpected(bad_field("backoff.multiplier", "a number >= 1"));
        }
        backoff.multiplier = it->get<double>();
    }

    if (const auto it = node.find("jitter"); it != node.end()) {
        if (it->is_number() == false || it->get<double>() < 0.0 || it->get<double>() > 1.0) {
            return tl::unexpected(bad_field("backoff.jitter", "a number in [0, 1]"));
        }
        backoff.jitter_factor = it->get<double>();
    }

    return backoff;
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// Builders
// ─────────────────────────────────────────────────────────────────────────────

DownloadConfig& DownloadConfig::with_user_agent(std::string agent) {
    user_agent = std::move(agent);
    return *this;
}

DownloadConfig& DownloadConfig::with_header(const std::string& name, const std::string& value) {
    extra_headers[name] = value;
    return *this;
}

DownloadConfig& DownloadConfig::with_connect_timeout(std::chrono::milliseconds timeout) {
    connect_timeout = timeout;
    return *this;
}

DownloadConfig& DownloadConfig::with_chunk_timeout(std::chrono::milliseconds timeout) {
    if (timeout < kMinChunkTimeout) {
        UPLINK_LOG_WARN("Chunk timeout of {} ms is below the {} ms minimum, using the minimum",
                        timeout.count(), kMinChunkTimeout.count());
        timeout = kMinChunkTimeout;
    }
    chunk_timeout = timeout;
    return *this;
}

DownloadConfig& DownloadConfig::with_progress_interval(std::chrono::milliseconds interval) {
    progress_interval = interval;
    return *this;
}

DownloadConfig& DownloadConfig::with_min_free_space(std::uint64_t bytes) {
    min_free_space = bytes;
    return *this;
}

DownloadConfig& DownloadConfig::with_max_retries(std::size_t retries) {
    retry.with_max_retries(retries);
    return *this;
}

DownloadConfig& DownloadConfig::with_backoff(const BackoffConfig& backoff) {
    retry.with_backoff(backoff);
    return *this;
}

DownloadConfig& DownloadConfig::with_retry_policy(RetryPolicy policy) {
    retry = std::move(policy);
    return *this;
}

DownloadConfig& DownloadConfig::with_backoff_policy(std::shared_ptr<IBackoffPolicy> policy) {
    backoff_policy = std::move(policy);
    return *this;
}

DownloadConfig& DownloadConfig::with_throttle(std::uint64_t bytes_per_second) {
    if (bytes_per_second > 0) {
        max_bytes_per_second = bytes_per_second;
    } else {
        max_bytes_per_second.reset();
    }
    return *this;
}

DownloadConfig& DownloadConfig::with_failure_injection(std::uint8_t percent) {
    fail_percent = std::min<std::uint8_t>(percent, 100);
    return *this;
}

HeaderMap DownloadConfig::default_headers() const {
    HeaderMap headers = extra_headers;
    headers["User-Agent"] = user_agent;
    headers["Connection"] = "keep-alive";
    return headers;
}

DownloadConfig& DownloadConfig::apply_environment() {
    if (const auto bps = parse_env_number<std::uint64_t>("UPLINK_MAX_BPS"); bps.has_value()) {
        if (*bps > 0) {
            max_bytes_per_second = *bps;
            UPLINK_LOG_INFO("Throttling downloads to {} bytes/s (UPLINK_MAX_BPS)", *bps);
        }
    }

    if (const auto pct = parse_env_number<unsigned>("UPLINK_FAIL_PCT"); pct.has_value()) {
        if (*pct <= 100) {
            fail_percent = static_cast<std::uint8_t>(*pct);
            if (fail_percent > 0) {
                UPLINK_LOG_WARN("Injecting simulated failures on {}% of chunks (UPLINK_FAIL_PCT)",
                                *pct);
            }
        } else {
            UPLINK_LOG_WARN("Ignoring UPLINK_FAIL_PCT={}: must be 0-100", *pct);
        }
    }
    return *this;
}

// ─────────────────────────────────────────────────────────────────────────────
// JSON
// ─────────────────────────────────────────────────────────────────────────────

nlohmann::json DownloadConfig::to_json() const {
    const BackoffConfig& backoff = retry.backoff();

    nlohmann::json kinds = nlohmann::json::array();
    for (const auto kind : retry.retry_on()) {
        kinds.push_back(std::string(to_string(kind)));
    }

    nlohmann::json payload = nlohmann::json::object();
    payload["user_agent"] = user_agent;
    payload["extra_headers"] = extra_headers;
    payload["connect_timeout_ms"] = connect_timeout.count();
    payload["chunk_timeout_ms"] = chunk_timeout.count();
    payload["verify_ssl"] = verify_ssl;
    payload["progress_interval_ms"] = progress_interval.count();
    payload["min_free_space_bytes"] = min_free_space;
    payload["max_retries"] = retry.max_retries();
    payload["retry_on"] = std::move(kinds);
    payload["backoff"] = {
        {"strategy", std::string(to_string(backoff.strategy))},
        {"base_ms", backoff.base.count()},
        {"multiplier", backoff.multiplier},
        {"increment_ms", backoff.increment.count()},
        {"max_ms", backoff.max.count()},
        {"jitter", backoff.jitter_factor}
    };
    if (max_bytes_per_second.has_value()) {
        payload["max_bytes_per_second"] = *max_bytes_per_second;
    }
    payload["fail_percent"] = fail_percent;
    return payload;
}

DownloadResult<DownloadConfig> DownloadConfig::from_json(const nlohmann::json& payload) {
    if (payload.is_object() == false) {
        return tl::unexpected(DownloadError::configuration(
            "Invalid download config: expected a JSON object"));
    }

    DownloadConfig config;

    if (const auto it = payload.find("user_agent"); it != payload.end()) {
        if (it->is_string() == false) {
            return tl::unexpected(bad_field("user_agent", "a string"));
        }
        config.user_agent = it->get<std::string>();
    }

    if (const auto it = payload.find("extra_headers"); it != payload.end()) {
        if (it->is_object() == false) {
            return tl::unexpected(bad_field("extra_headers", "an object of strings"));
        }
        for (const auto& [name, value] : it->items()) {
            if (value.is_string() == false) {
                return tl::unexpected(bad_field("extra_headers", "an object of strings"));
            }
            config.extra_headers[name] = value.get<std::string>();
        }
    }

    if (auto r = read_millis(payload, "connect_timeout_ms", config.connect_timeout); !r) {
        return tl::unexpected(r.error());
    }
    if (auto r = read_millis(payload, "chunk_timeout_ms", config.chunk_timeout); !r) {
        return tl::unexpected(r.error());
    }
    if (config.chunk_timeout < kMinChunkTimeout) {
        return tl::unexpected(bad_field(
            "chunk_timeout_ms", std::format("at least {}", kMinChunkTimeout.count())));
    }
    if (auto r = read_millis(payload, "progress_interval_ms", config.progress_interval); !r) {
        return tl::unexpected(r.error());
    }

    if (const auto it = payload.find("verify_ssl"); it != payload.end()) {
        if (it->is_boolean() == false) {
            return tl::unexpected(bad_field("verify_ssl", "a boolean"));
        }
        config.verify_ssl = it->get<bool>();
    }

    if (const auto it = payload.find("min_free_space_bytes"); it != payload.end()) {
        if (is_non_negative_integer(*it) == false) {
            return tl::unexpected(bad_field("min_free_space_bytes", "a non-negative integer"));
        }
        config.min_free_space = it->get<std::uint64_t>();
    }

    if (const auto it = payload.find("max_retries"); it != payload.end()) {
        if (is_non_negative_integer(*it) == false) {
            return tl::unexpected(bad_field("max_retries", "a non-negative integer"));
        }
        config.retry.with_max_retries(it->get<std::size_t>());
    }

    if (const auto it = payload.find("retry_on"); it != payload.end()) {
        if (it->is_array() == false) {
            return tl::unexpected(bad_field("retry_on", "an array of retry kinds"));
        }
        config.retry.with_no_retry_kinds();
        for (const auto& node : *it) {
            if (node.is_string() == false) {
                return tl::unexpected(bad_field("retry_on", "an array of retry kinds"));
            }
            const auto kind = retry_kind_from_string(node.get<std::string>());
            if (kind.has_value() == false) {
                return tl::unexpected(DownloadError::configuration(
                    "Invalid download config: unknown retry kind '" + node.get<std::string>() + "'"));
            }
            config.retry.with_retry_on(*kind);
        }
    }

    if (const auto it = payload.find("backoff"); it != payload.end()) {
        auto backoff = parse_backoff(*it, config.retry.backoff());
        if (backoff.has_value() == false) {
            return tl::unexpected(backoff.error());
        }
        config.retry.with_backoff(*backoff);
    }

    if (const auto it = payload.find("max_bytes_per_second"); it != payload.end()) {
        if (it->is_null() == false) {
            if (is_non_negative_integer(*it) == false) {
                return tl::unexpected(bad_field("max_bytes_per_second", "a non-negative integer"));
            }
            config.with_throttle(it->get<std::uint64_t>());
        }
    }

    if (const auto it = payload.find("fail_percent"); it != payload.end()) {
        if (is_non_negative_integer(*it) == false || it->get<std::uint64_t>() > 100) {
            return tl::unexpected(bad_field("fail_percent", "an integer in [0, 100]"));
        }
        config.fail_percent = static_cast<std::uint8_t>(it->get<std::uint64_t>());
    }

    return config;
}

}  // namespace uplink
