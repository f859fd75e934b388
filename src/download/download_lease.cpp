#include "uplink/download/download_lease.hpp"

#include "uplink/log/logger.hpp"

namespace uplink {

// ─────────────────────────────────────────────────────────────────────────────
// DownloadLease
// ─────────────────────────────────────────────────────────────────────────────

DownloadLease::~DownloadLease() {
    release();
}

DownloadLease::DownloadLease(DownloadLease&& other) noexcept
    : state_(std::move(other.state_))
    , key_(std::move(other.key_))
    , path_(std::move(other.path_))
{
    other.state_.reset();
}

DownloadLease& DownloadLease::operator=(DownloadLease&& other) noexcept {
    if (this != &other) {
        release();
        state_ = std::move(other.state_);
        key_ = std::move(other.key_);
        path_ = std::move(other.path_);
        other.state_.reset();
    }
    return *this;
}

void DownloadLease::release() noexcept {
    if (state_ == nullptr) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->active.erase(key_);
    }
    state_.reset();
}

// ─────────────────────────────────────────────────────────────────────────────
// DownloadLeaseRegistry
// ─────────────────────────────────────────────────────────────────────────────

DownloadLeaseRegistry::DownloadLeaseRegistry()
    : state_(std::make_shared<DownloadLease::State>())
{}

DownloadLeaseRegistry& DownloadLeaseRegistry::global() {
    static DownloadLeaseRegistry registry;
    return registry;
}

std::string DownloadLeaseRegistry::normalize(const std::filesystem::path& destination) {
    std::error_code ec;
    auto resolved = std::filesystem::weakly_canonical(destination, ec);
    if (ec) {
        resolved = std::filesystem::absolute(destination, ec);
        if (ec) {
            resolved = destination;
        }
    }
    return resolved.lexically_normal().string();
}

DownloadResult<DownloadLease> DownloadLeaseRegistry::try_acquire(const std::filesystem::path& destination) {
    std::string key = normalize(destination);

    std::lock_guard<std::mutex> lock(state_->mutex);
    const bool inserted = state_->active.insert(key).second;
    if (inserted == false) {
        UPLINK_LOG_WARN("Refusing second download into {}", destination.string());
        return tl::unexpected(DownloadError::already_in_progress());
    }
    return DownloadLease(state_, std::move(key), destination);
}

bool DownloadLeaseRegistry::is_active(const std::filesystem::path& destination) const {
    const std::string key = normalize(destination);
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->active.contains(key);
}

std::size_t DownloadLeaseRegistry::active_count() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->active.size();
}

}  // namespace uplink
