// =============================================================================
// cadvc - Chunk Packer
// =============================================================================
// Bin-packs the binary members of an expanded tree into size-capped ZIP
// archives named <prefix><n>.zip (n = 1..N), and restores them again.
//
// Packing is greedy over candidates sorted by relative path. One archive is
// built in memory at a time; a candidate whose projected size would push the
// archive over the cap flushes the archive and is retried against an empty
// one. A candidate that does not fit an empty archive fails the pack with
// kFileTooLarge. Every flushed archive is written through a temporary file,
// fsynced and renamed, and only then are its source files deleted.
//
// Requirements: byte-reproducible chunks for unchanged input (fixed member
// timestamps, stable ordering).
// =============================================================================

#ifndef CADVC_ALGO_CHUNK_PACKER_H
#define CADVC_ALGO_CHUNK_PACKER_H

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "cadvc/common/config.h"
#include "cadvc/common/error.h"
#include "cadvc/common/types.h"

namespace cadvc::algo {

// =============================================================================
// Chunk Packer Configuration
// =============================================================================

/// @brief Configuration for chunk packing
struct ChunkPackerConfig {
    /// @brief Glob patterns selecting candidates
    std::vector<std::string> patterns;

    /// @brief Hard cap on a single chunk archive, in bytes
    std::uint64_t maxChunkBytes = 0;

    /// @brief Deflate level for chunk members (0-9)
    CompressionLevel compressionLevel = kDefaultCompressionLevel;

    /// @brief Chunk archive file name prefix
    std::string chunkPrefix;

    /// @brief Build from the repository configuration
    [[nodiscard]] static ChunkPackerConfig fromRepository(const RepositoryConfig& config);

    /// @brief Validate configuration
    /// @return VoidResult indicating success or error
    [[nodiscard]] VoidResult validate() const;
};

// =============================================================================
// Results
// =============================================================================

/// @brief Outcome of a pack.
struct PackResult {
    /// @brief Chunk archives written, in index order.
    std::vector<std::filesystem::path> chunks;

    /// @brief Number of source files moved into chunks.
    std::size_t packedFiles = 0;
};

/// @brief Outcome of an unpack.
struct UnpackResult {
    /// @brief Number of chunk archives read.
    std::size_t chunkCount = 0;

    /// @brief Number of files restored.
    std::size_t restoredFiles = 0;

    /// @brief Indices absent from the 1..max sequence.
    std::vector<std::uint32_t> missingIndices;
};

/// @brief A chunk archive found on disk.
struct ChunkFile {
    std::uint32_t index = 0;
    std::filesystem::path path;
};

// =============================================================================
// Chunk Packer Class
// =============================================================================

/// @brief Packs and restores binary members of an expanded tree.
///
/// Usage:
/// @code
/// ChunkPacker packer(ChunkPackerConfig::fromRepository(config));
/// auto packed = packer.pack(treeRoot);
/// if (!packed) {
///     // packed.error().code() == ErrorCode::kFileTooLarge, ...
/// }
/// @endcode
class ChunkPacker {
public:
    /// @brief Construct with configuration
    explicit ChunkPacker(ChunkPackerConfig config);

    /// @brief Move matching files of the tree into chunk archives.
    /// @param treeRoot Expanded tree root.
    /// @return Written chunks, or kFileTooLarge / kIOError.
    [[nodiscard]] Result<PackResult> pack(const std::filesystem::path& treeRoot) const;

    /// @brief Extract every chunk archive of the tree in index order.
    /// @param treeRoot Expanded tree root.
    /// @return Restore statistics, or kCorruptArchive / kIOError.
    /// @note Chunk archives are left in place.
    [[nodiscard]] Result<UnpackResult> unpack(const std::filesystem::path& treeRoot) const;

    /// @brief Candidate files, sorted by tree-relative POSIX path.
    [[nodiscard]] std::vector<std::filesystem::path> collectCandidates(
        const std::filesystem::path& treeRoot) const;

    /// @brief Chunk archives at the top of the tree, sorted by index.
    [[nodiscard]] std::vector<ChunkFile> findChunks(const std::filesystem::path& treeRoot) const;

    /// @brief Parse `<prefix><n>.zip` and return n.
    [[nodiscard]] std::optional<std::uint32_t> chunkIndexOf(std::string_view fileName) const;

    /// @brief True for chunk archives and their in-flight temporaries.
    [[nodiscard]] bool isChunkArtifact(std::string_view fileName) const;

    /// @brief File name of the chunk with the given index.
    [[nodiscard]] std::string chunkFileName(std::uint32_t index) const;

    [[nodiscard]] const ChunkPackerConfig& config() const noexcept { return config_; }

private:
    PackResult packImpl(const std::filesystem::path& treeRoot) const;
    UnpackResult unpackImpl(const std::filesystem::path& treeRoot) const;

    ChunkPackerConfig config_;
};

}  // namespace cadvc::algo

#endif  // CADVC_ALGO_CHUNK_PACKER_H
