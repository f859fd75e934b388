#include "uplink/download/progress.hpp"

namespace uplink {

namespace {
constexpr double kBytesPerMegabyte = 1024.0 * 1024.0;
}  // namespace

ProgressSample ProgressSample::transfer(
    std::uint64_t downloaded,
    std::uint64_t total,
    std::uint64_t resumed_from,
    std::chrono::steady_clock::duration elapsed,
    std::size_t retry_count
) {
    ProgressSample sample;
    sample.downloaded = downloaded;
    sample.total = total;
    sample.retry_count = retry_count;

    const double seconds = std::chrono::duration<double>(elapsed).count();
    if (seconds > 0.0 && downloaded >= resumed_from) {
        sample.speed = static_cast<double>(downloaded - resumed_from) / kBytesPerMegabyte / seconds;
    }

    if (total > 0) {
        sample.percentage = static_cast<double>(downloaded) / static_cast<double>(total) * 100.0;
    }
    return sample;
}

ProgressSample ProgressSample::retry_notification(std::size_t retry_count, std::string reason) {
    ProgressSample sample;
    sample.retry_count = retry_count;
    sample.is_retrying = true;
    sample.retry_reason = std::move(reason);
    return sample;
}

nlohmann::json ProgressSample::to_json() const {
    nlohmann::json j{
        {"percentage", percentage},
        {"speed", speed},
        {"downloaded", downloaded},
        {"total", total},
        {"retry_count", retry_count},
        {"is_retrying", is_retrying}
    };
    if (is_retrying) {
        j["retry_reason"] = retry_reason;
    } else {
        j["retry_reason"] = nullptr;
    }
    return j;
}

}  // namespace uplink
