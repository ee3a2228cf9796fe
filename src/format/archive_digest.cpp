// =============================================================================
// cadvc - Archive Content Digest Implementation
// =============================================================================

#include "cadvc/format/archive_digest.h"

#include <algorithm>

#include <xxhash.h>

#include "cadvc/common/error.h"
#include "cadvc/common/logger.h"
#include "cadvc/format/zip_archive.h"

namespace cadvc::format {

Checksum calculateXxHash64(std::span<const std::uint8_t> data, std::uint64_t seed) noexcept {
    return XXH64(data.data(), data.size(), seed);
}

ArchiveDigest digestArchive(const std::filesystem::path& archive) {
    ZipReader reader(archive);

    ArchiveDigest result;
    for (const auto& entry : reader.entries()) {
        if (entry.isDirectory()) {
            continue;
        }
        const auto data = reader.read(entry.name);
        result.members.push_back(MemberDigest{entry.name, data.size(), calculateXxHash64(data)});
    }

    std::sort(result.members.begin(), result.members.end(),
              [](const MemberDigest& a, const MemberDigest& b) { return a.name < b.name; });

    XXH64_state_t* state = XXH64_createState();
    if (state == nullptr) {
        throw IOError("Failed to create xxHash64 state");
    }
    XXH64_reset(state, 0);
    for (const auto& member : result.members) {
        XXH64_update(state, member.name.data(), member.name.size() + 1);
        XXH64_update(state, &member.size, sizeof(member.size));
        XXH64_update(state, &member.digest, sizeof(member.digest));
    }
    result.combined = XXH64_digest(state);
    XXH64_freeState(state);

    CADVC_LOG_DEBUG("Digest of {}: {} members, {:016x}", archive.string(), result.members.size(),
                    result.combined);
    return result;
}

DigestDiff compareDigests(const ArchiveDigest& left, const ArchiveDigest& right) {
    DigestDiff diff;

    auto l = left.members.begin();
    auto r = right.members.begin();
    while (l != left.members.end() || r != right.members.end()) {
        if (r == right.members.end() || (l != left.members.end() && l->name < r->name)) {
            diff.onlyInLeft.push_back(l->name);
            ++l;
        } else if (l == left.members.end() || r->name < l->name) {
            diff.onlyInRight.push_back(r->name);
            ++r;
        } else {
            if (l->size != r->size || l->digest != r->digest) {
                diff.differing.push_back(l->name);
            }
            ++l;
            ++r;
        }
    }

    return diff;
}

}  // namespace cadvc::format
