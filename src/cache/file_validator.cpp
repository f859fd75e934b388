#include "uplink/cache/file_validator.hpp"

#include "uplink/log/logger.hpp"

#include <array>
#include <fstream>

namespace uplink {

DownloadResult<bool> validate_cached_file(
    const std::filesystem::path& path,
    std::optional<std::uint64_t> expected_size
) {
    std::error_code ec;
    if (std::filesystem::exists(path, ec) == false) {
        return false;
    }

    const auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        return tl::unexpected(DownloadError::filesystem("Failed to get file metadata", ec));
    }

    if (expected_size.has_value() && size != *expected_size) {
        UPLINK_LOG_DEBUG("File size mismatch for {}: expected {}, got {}",
                         path.string(), *expected_size, size);
        return false;
    }

    if (size == 0) {
        UPLINK_LOG_DEBUG("{} is empty", path.string());
        return false;
    }

    if (size < kMinValidFileSize) {
        UPLINK_LOG_DEBUG("{} is suspiciously small: {} bytes", path.string(), size);
        return false;
    }

    std::ifstream file(path, std::ios::binary);
    if (file.is_open() == false) {
        UPLINK_LOG_DEBUG("Cannot open {} for validation", path.string());
        return false;
    }

    std::array<char, 16> buffer{};
    file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
    if (file.gcount() <= 0) {
        UPLINK_LOG_DEBUG("{} is not readable", path.string());
        return false;
    }

    UPLINK_LOG_DEBUG("File validation passed: {} ({} bytes)", path.string(), size);
    return true;
}

}  // namespace uplink
