#pragma once

#include "uplink/error/download_error.hpp"

#include <cstddef>
#include <filesystem>
#include <memory>
#include <mutex>
#include <set>
#include <string>

namespace uplink {

class DownloadLeaseRegistry;

// ─────────────────────────────────────────────────────────────────────────────
// DownloadLease
// ─────────────────────────────────────────────────────────────────────────────
// Exclusive right to write one destination path. Released when destroyed or
// on release(), whichever comes first. Move-only.

class DownloadLease {
public:
    ~DownloadLease();

    DownloadLease(const DownloadLease&) = delete;
    DownloadLease& operator=(const DownloadLease&) = delete;
    DownloadLease(DownloadLease&& other) noexcept;
    DownloadLease& operator=(DownloadLease&& other) noexcept;

    void release() noexcept;

    [[nodiscard]] bool held() const noexcept {
        return state_ != nullptr;
    }

    [[nodiscard]] const std::filesystem::path& path() const noexcept {
        return path_;
    }

private:
    friend class DownloadLeaseRegistry;

    struct State {
        std::mutex mutex;
        std::set<std::string> active;
    };

    DownloadLease(std::shared_ptr<State> state, std::string key, std::filesystem::path path)
        : state_(std::move(state))
        , key_(std::move(key))
        , path_(std::move(path))
    {}

    std::shared_ptr<State> state_;
    std::string key_;
    std::filesystem::path path_;
};

// ─────────────────────────────────────────────────────────────────────────────
// DownloadLeaseRegistry
// ─────────────────────────────────────────────────────────────────────────────
// One writer per destination. A second try_acquire() for a path that is
// already leased fails with "Download already in progress"; different paths
// never block each other.
//
//   auto lease = registry.try_acquire(dest);
//   if (!lease) return tl::unexpected(lease.error());
//   // ... download; the lease is dropped on every exit path
//
// Paths are compared after normalization, so "cache/./a.7z" and "cache/a.7z"
// are the same target. Leases keep the registry state alive, so a lease may
// outlive the registry it came from.

class DownloadLeaseRegistry {
public:
    DownloadLeaseRegistry();

    [[nodiscard]] DownloadResult<DownloadLease> try_acquire(const std::filesystem::path& destination);

    [[nodiscard]] bool is_active(const std::filesystem::path& destination) const;

    [[nodiscard]] std::size_t active_count() const;

    /// Process-wide registry used by DownloadService by default.
    static DownloadLeaseRegistry& global();

private:
    static std::string normalize(const std::filesystem::path& destination);

    std::shared_ptr<DownloadLease::State> state_;
};

}  // namespace uplink
