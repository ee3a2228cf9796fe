// =============================================================================
// cadvc - Archive Transformer
// =============================================================================
// Lossless conversion between a CAD archive (.FCStd ZIP) and its expanded
// tree, the diff-friendly directory that is actually committed.
//
// Export:
//   archive -> extract members -> relocate top-level extensionless members
//   into no_extension/ -> pack binaries into chunk archives -> .changefile
//
// Import:
//   unpack chunk archives -> walk tree (minus chunk archives and marker
//   files, no_extension/X mapped back to X) -> <archive>.tmp -> rename
//
// import(export(A)) reproduces A's member set and member bytes.
// =============================================================================

#ifndef CADVC_TRANSFORM_ARCHIVE_TRANSFORMER_H
#define CADVC_TRANSFORM_ARCHIVE_TRANSFORMER_H

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include "cadvc/common/config.h"
#include "cadvc/common/error.h"
#include "cadvc/common/types.h"

namespace cadvc::transform {

// =============================================================================
// Results
// =============================================================================

/// @brief Outcome of an export.
struct ExportResult {
    /// @brief Expanded tree that was written.
    std::filesystem::path treeRoot;

    /// @brief Number of archive members extracted.
    std::size_t memberCount = 0;

    /// @brief Number of extracted files moved into chunk archives.
    std::size_t chunkedCount = 0;

    /// @brief Number of chunk archives written.
    std::size_t chunkCount = 0;

    /// @brief Number of top-level members relocated into no_extension/.
    std::size_t relocatedCount = 0;
};

/// @brief Outcome of an import.
struct ImportResult {
    /// @brief Archive that was written.
    std::filesystem::path archive;

    /// @brief Number of members written into the archive.
    std::size_t memberCount = 0;

    /// @brief Number of files restored from chunk archives first.
    std::size_t unchunkedCount = 0;
};

// =============================================================================
// Change Indicator
// =============================================================================

/// @brief Render the .changefile content.
[[nodiscard]] std::string formatChangeFile(const ArchiveIdentity& identity,
                                           std::chrono::system_clock::time_point exportedAt);

/// @brief Extract the archive identity from .changefile content.
/// @return std::nullopt if the relpath line is missing or empty.
[[nodiscard]] std::optional<ArchiveIdentity> parseChangeFile(std::string_view content);

/// @brief Read and parse a .changefile on disk.
/// @return std::nullopt if the file is unreadable or has no relpath line.
[[nodiscard]] std::optional<ArchiveIdentity> readChangeFile(const std::filesystem::path& path);

// =============================================================================
// Archive Transformer Class
// =============================================================================

/// @brief Exports archives to expanded trees and imports them back.
///
/// Usage:
/// @code
/// ArchiveTransformer transformer(loadConfig(repoRoot), repoRoot);
/// auto exported = transformer.exportArchive(repoRoot / "parts/gear.FCStd");
/// auto imported = transformer.importArchive(exported->treeRoot, archivePath);
/// @endcode
class ArchiveTransformer {
public:
    /// @brief Construct with configuration.
    /// @param config Repository configuration snapshot.
    /// @param repoRoot Repository root used for archive identities; when absent
    ///        it is discovered from each archive's location.
    explicit ArchiveTransformer(RepositoryConfig config,
                                std::optional<std::filesystem::path> repoRoot = std::nullopt);

    /// @brief Expand an archive into its tree.
    /// @param archive Archive path.
    /// @param treeRoot Destination; defaults to treeRootFor(archive).
    /// @return Export statistics, or kNotFound / kWrongFileType /
    ///         kCorruptArchive / kPermissionDenied / kFileTooLarge / kIOError.
    [[nodiscard]] Result<ExportResult> exportArchive(
        const std::filesystem::path& archive,
        const std::optional<std::filesystem::path>& treeRoot = std::nullopt) const;

    /// @brief Rebuild an archive from its tree.
    /// @param treeRoot Expanded tree.
    /// @param archive Archive path to (re)write.
    /// @return Import statistics, or kNotFound / kCorruptArchive / kIOError.
    /// @note The tree is never deleted; chunk archives stay in place.
    [[nodiscard]] Result<ImportResult> importArchive(const std::filesystem::path& treeRoot,
                                                     const std::filesystem::path& archive) const;

    /// @brief Expanded tree location for an archive.
    [[nodiscard]] std::filesystem::path treeRootFor(const std::filesystem::path& archive) const;

    /// @brief Repository root that owns an archive.
    [[nodiscard]] std::filesystem::path repoRootFor(const std::filesystem::path& archive) const;

    /// @brief Repository-relative POSIX identity of an archive.
    [[nodiscard]] ArchiveIdentity identityOf(const std::filesystem::path& archive) const;

    [[nodiscard]] const RepositoryConfig& config() const noexcept { return config_; }

private:
    /// @brief Absolute path of an archive given relative to the repository.
    std::filesystem::path resolve(const std::filesystem::path& archive) const;

    ExportResult exportImpl(const std::filesystem::path& archive,
                            const std::filesystem::path& treeRoot) const;
    ImportResult importImpl(const std::filesystem::path& treeRoot,
                            const std::filesystem::path& archive) const;

    RepositoryConfig config_;
    std::optional<std::filesystem::path> repoRoot_;
};

// =============================================================================
// Convenience Functions
// =============================================================================

/// @brief Export with the configuration of the archive's repository.
/// @param config Configuration override; loaded from the repository if absent.
[[nodiscard]] Result<ExportResult> exportArchive(
    const std::filesystem::path& archive,
    const std::optional<std::filesystem::path>& treeRoot = std::nullopt,
    const std::optional<RepositoryConfig>& config = std::nullopt);

/// @brief Import with the configuration of the archive's repository.
/// @param config Configuration override; loaded from the repository if absent.
[[nodiscard]] Result<ImportResult> importArchive(
    const std::filesystem::path& treeRoot, const std::filesystem::path& archive,
    const std::optional<RepositoryConfig>& config = std::nullopt);

}  // namespace cadvc::transform

#endif  // CADVC_TRANSFORM_ARCHIVE_TRANSFORMER_H
