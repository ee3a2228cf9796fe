// =============================================================================
// cadvc - Common Type Definitions
// =============================================================================
// Core type definitions and constants shared by the cadvc library.
//
// This module defines:
// - ArchiveIdentity: repository-relative POSIX path of one CAD archive
// - CompressionLevel, Checksum: scalar type aliases
// - Well-known file names inside an expanded tree
// - Thresholds and defaults used by the lifecycle and lock layers
//
// Naming Conventions (per project style guide):
// - Enums: PascalCase with kConstant values
// - Classes/Structs: PascalCase
// - Member variables: camelCase with trailing _
// - Constants: kConstant
// =============================================================================

#ifndef CADVC_COMMON_TYPES_H
#define CADVC_COMMON_TYPES_H

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace cadvc {

// =============================================================================
// Type Aliases
// =============================================================================

/// @brief Repository-relative POSIX path of one archive (e.g. "parts/gear.FCStd").
/// @note Identity is path based; two byte-identical archives at different
///       paths are different identities.
using ArchiveIdentity = std::string;

/// @brief Type alias for deflate compression level (0-9).
using CompressionLevel = std::uint8_t;

/// @brief Type alias for checksum values (xxHash64).
using Checksum = std::uint64_t;

// =============================================================================
// Constants
// =============================================================================

/// @brief Default deflate level for chunk archives.
inline constexpr CompressionLevel kDefaultCompressionLevel = 6;

/// @brief Minimum deflate level (stored, no compression).
inline constexpr CompressionLevel kMinCompressionLevel = 0;

/// @brief Maximum deflate level.
inline constexpr CompressionLevel kMaxCompressionLevel = 9;

/// @brief Default chunk archive cap in gigabytes.
inline constexpr double kDefaultMaxChunkSizeGb = 2.0;

/// @brief Bytes per gigabyte used when converting the configured cap.
inline constexpr std::uint64_t kBytesPerGigabyte = 1024ULL * 1024ULL * 1024ULL;

/// @brief A staged archive larger than this is considered not exported.
inline constexpr std::uint64_t kEmptyArchiveThreshold = 1'024;  // 1KB

/// @brief Default deadline for every external command.
inline constexpr std::chrono::milliseconds kDefaultCommandTimeout{30'000};

/// @brief Archive file extension, compared case-insensitively.
inline constexpr std::string_view kArchiveExtension = ".fcstd";

/// @brief Change indicator written by every export.
inline constexpr std::string_view kChangeFileName = ".changefile";

/// @brief Proxy marker that carries the lock for its archive.
inline constexpr std::string_view kLockFileName = ".lockfile";

/// @brief Folder that holds top-level members without an extension.
inline constexpr std::string_view kNoExtensionDir = "no_extension";

/// @brief Key in the change indicator that records the archive identity.
inline constexpr std::string_view kChangeFileRelpathKey = "FCStd_file_relpath";

/// @brief Fallback owner when the lock primitive does not name the holder.
inline constexpr std::string_view kUnknownLockOwner = "another user";

// =============================================================================
// Utility Functions
// =============================================================================

/// @brief Check whether a file name carries the archive extension.
/// @param name File name or path string.
[[nodiscard]] constexpr bool hasArchiveExtension(std::string_view name) noexcept {
    if (name.size() < kArchiveExtension.size()) {
        return false;
    }
    auto tail = name.substr(name.size() - kArchiveExtension.size());
    for (std::size_t i = 0; i < tail.size(); ++i) {
        char c = tail[i];
        if (c >= 'A' && c <= 'Z') {
            c = static_cast<char>(c - 'A' + 'a');
        }
        if (c != kArchiveExtension[i]) {
            return false;
        }
    }
    return true;
}

}  // namespace cadvc

#endif  // CADVC_COMMON_TYPES_H
