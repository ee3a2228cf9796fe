// =============================================================================
// cadvc - Repository Configuration
// =============================================================================
// Per-repository settings that drive export, chunking and lock policy.
//
// The configuration lives in `.gitpdm/config.json`, with the legacy
// `FreeCAD_Automation/config.json` as a fallback. Files are parsed with
// yaml-cpp, so JSON (a YAML flow subset) is accepted as-is. Both the flat
// native keys and the nested legacy keys are understood.
//
// Loading never fails: an unreadable file yields defaults, and a malformed
// field falls back to its default with a warning.
// =============================================================================

#ifndef CADVC_COMMON_CONFIG_H
#define CADVC_COMMON_CONFIG_H

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "cadvc/common/error.h"
#include "cadvc/common/types.h"

namespace cadvc {

// =============================================================================
// Configuration File Locations
// =============================================================================

/// @brief Native configuration file, relative to the repository root.
inline constexpr std::string_view kConfigRelPath = ".gitpdm/config.json";

/// @brief Legacy configuration file, relative to the repository root.
inline constexpr std::string_view kLegacyConfigRelPath = "FreeCAD_Automation/config.json";

// =============================================================================
// RepositoryConfig
// =============================================================================

/// @brief Immutable configuration snapshot, loaded once per invocation.
struct RepositoryConfig {
    /// @brief Prefix prepended to the archive stem for the tree name.
    std::string uncompressedPrefix;

    /// @brief Suffix appended to the archive stem for the tree name.
    std::string uncompressedSuffix = "_uncompressed";

    /// @brief Place trees inside a shared subdirectory next to the archive.
    bool subdirectoryMode = false;

    /// @brief Subdirectory name used when subdirectoryMode is on.
    std::string subdirectoryName = ".freecad_data";

    /// @brief Keep thumbnails/ members on export.
    bool includeThumbnails = true;

    /// @brief Enforce lock ownership in pre-commit and pre-push.
    bool requireLock = true;

    /// @brief Pack matching binaries into chunk archives.
    bool compressBinaries = true;

    /// @brief Glob patterns selecting chunk candidates.
    std::vector<std::string> binaryPatterns = {"*.brp", "*.Map.*", "no_extension/*"};

    /// @brief Hard upper bound on a single chunk archive, in bytes.
    std::uint64_t maxChunkBytes =
        static_cast<std::uint64_t>(kDefaultMaxChunkSizeGb * static_cast<double>(kBytesPerGigabyte));

    /// @brief Deflate level used for chunk members (0-9).
    CompressionLevel compressionLevel = kDefaultCompressionLevel;

    /// @brief File name prefix of chunk archives.
    std::string chunkPrefix = "binaries_";

    /// @brief Chunk cap expressed in gigabytes.
    [[nodiscard]] double maxChunkSizeGb() const noexcept {
        return static_cast<double>(maxChunkBytes) / static_cast<double>(kBytesPerGigabyte);
    }
};

// =============================================================================
// Loading and Saving
// =============================================================================

/// @brief Parse configuration text (JSON or YAML).
/// @param text File contents.
/// @return Parsed config, or kConfigInvalid if the document is unusable.
/// @note Individual malformed fields fall back to defaults with a warning.
[[nodiscard]] Result<RepositoryConfig> parseConfig(std::string_view text);

/// @brief Load the configuration of a repository.
/// @param repoRoot Repository root directory.
/// @return The parsed configuration, or defaults when missing or unreadable.
[[nodiscard]] RepositoryConfig loadConfig(const std::filesystem::path& repoRoot);

/// @brief Write the configuration in the native flat form.
/// @param repoRoot Repository root directory.
/// @param config Configuration to persist.
[[nodiscard]] VoidResult saveConfig(const std::filesystem::path& repoRoot,
                                    const RepositoryConfig& config);

/// @brief Serialize the configuration in the native flat form (JSON).
[[nodiscard]] std::string serializeConfig(const RepositoryConfig& config);

/// @brief Check whether a native or legacy configuration file exists.
[[nodiscard]] bool hasConfig(const std::filesystem::path& repoRoot);

/// @brief Path of the configuration file in effect (native if neither exists).
[[nodiscard]] std::filesystem::path configFilePath(const std::filesystem::path& repoRoot);

// =============================================================================
// Path Helpers
// =============================================================================

/// @brief Compute the expanded tree location for an archive.
/// @param repoRoot Repository root, used when archive is relative.
/// @param archive Archive path (absolute or relative to repoRoot).
/// @param config Active configuration.
/// @return `<archive parent>/[<subdir>/]<prefix><stem><suffix>`.
[[nodiscard]] std::filesystem::path uncompressedDirFor(const std::filesystem::path& repoRoot,
                                                       const std::filesystem::path& archive,
                                                       const RepositoryConfig& config);

/// @brief Walk up from start looking for a `.git` entry.
/// @return The repository root, or std::nullopt outside a repository.
[[nodiscard]] std::optional<std::filesystem::path> findRepoRoot(
    const std::filesystem::path& start);

}  // namespace cadvc

#endif  // CADVC_COMMON_CONFIG_H
