// =============================================================================
// cadvc - Archive Content Digest
// =============================================================================
// Logical content fingerprint of a ZIP container: member set plus an
// xxHash64 digest of every member's uncompressed bytes. Two archives with
// equal digests hold the same members with the same bytes, regardless of
// member order, timestamps or compression level.
// =============================================================================

#ifndef CADVC_FORMAT_ARCHIVE_DIGEST_H
#define CADVC_FORMAT_ARCHIVE_DIGEST_H

#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <vector>

#include "cadvc/common/types.h"

namespace cadvc::format {

/// @brief Digest of one member.
struct MemberDigest {
    std::string name;
    std::uint64_t size = 0;
    Checksum digest = 0;
};

/// @brief Digest of a whole archive; members sorted by name.
struct ArchiveDigest {
    std::vector<MemberDigest> members;

    /// @brief xxHash64 over the sorted (name, size, digest) triples.
    Checksum combined = 0;
};

/// @brief Differences between two archive digests.
struct DigestDiff {
    std::vector<std::string> onlyInLeft;
    std::vector<std::string> onlyInRight;
    std::vector<std::string> differing;

    [[nodiscard]] bool equal() const noexcept {
        return onlyInLeft.empty() && onlyInRight.empty() && differing.empty();
    }
};

/// @brief Calculate xxHash64 of a byte range.
[[nodiscard]] Checksum calculateXxHash64(std::span<const std::uint8_t> data,
                                         std::uint64_t seed = 0) noexcept;

/// @brief Digest every file member of an archive.
/// @throws IOError / FormatError if the archive cannot be read.
[[nodiscard]] ArchiveDigest digestArchive(const std::filesystem::path& archive);

/// @brief Compare two digests member by member.
[[nodiscard]] DigestDiff compareDigests(const ArchiveDigest& left, const ArchiveDigest& right);

}  // namespace cadvc::format

#endif  // CADVC_FORMAT_ARCHIVE_DIGEST_H
