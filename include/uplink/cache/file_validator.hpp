#pragma once

#include "uplink/error/download_error.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>

namespace uplink {

// Anything smaller is treated as a truncated or error-page download.
inline constexpr std::uint64_t kMinValidFileSize = 1024;

/// Cheap sanity check for a downloaded or cached archive. True when the file
/// exists, matches expected_size (if given), is at least kMinValidFileSize
/// bytes and its first bytes can be read. An error is returned only when the
/// file exists but its metadata cannot be read.
[[nodiscard]] DownloadResult<bool> validate_cached_file(
    const std::filesystem::path& path,
    std::optional<std::uint64_t> expected_size = std::nullopt
);

}  // namespace uplink
